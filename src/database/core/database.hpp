// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Strata - embedded SQLite access layer
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef STRATA_DATABASE_CORE_DATABASE_HPP
#define STRATA_DATABASE_CORE_DATABASE_HPP

#include <sqlite3.h>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "types.hpp"

namespace strata::database::core {

class Statement;
class Transaction;

/**
 * @brief The single persistent connection to one SQLite database file.
 *
 * Opening also switches on foreign-key enforcement. begin(), commit() and
 * rollback() go straight to the engine with no nesting bookkeeping, so a
 * misplaced call surfaces as the engine's own error inside a
 * TransactionError.
 *
 * Every operation other than close() throws SqlExecutionError once the
 * connection is closed. Failures are logged at debug level only; callers
 * decide how loudly to report them.
 */
class Database {
public:
    /**
     * @param db_name File path, or ":memory:".
     * @param flags sqlite3_open_v2 flags.
     * @throws DatabaseOpenError
     */
    explicit Database(const std::string& db_name,
                      int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    /// Closes the connection if it is still open.
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Raw engine handle.
    sqlite3* get();

    /// @throws StatementPrepareError
    std::unique_ptr<Statement> prepare(const std::string& sql);

    /**
     * @brief BEGIN, wrapped in a guard that rolls back unless committed.
     *
     * @throws TransactionError
     */
    std::unique_ptr<Transaction> beginTransaction();

    /**
     * @brief Runs one or more statements that take no parameters.
     *
     * @throws SqlExecutionError
     */
    void execute(const std::string& sql);

    bool isValid() const noexcept { return open.load(); }

    /**
     * @brief Applies "PRAGMA name = value" for each entry.
     *
     * PRAGMA arguments cannot be bound, so names must be plain identifiers
     * and values plain identifiers or signed integers.
     *
     * @throws ValidationError for anything else
     * @throws SqlExecutionError if the engine rejects a PRAGMA
     */
    void configure(const std::map<std::string, std::string>& pragmas);

    /// Retry window for a locked database file. 0 disables retrying.
    void setBusyTimeout(int milliseconds);

    /// @name Transaction control
    /// Each throws TransactionError carrying the engine's message.
    /// @{
    void begin();
    void commit();
    void rollback();
    /// @}

    /// False while the engine is in autocommit mode.
    bool inTransaction();

    /// Rows touched by the most recent INSERT, UPDATE or DELETE.
    std::int64_t changes();

    /// Rowid of the most recent successful INSERT.
    std::int64_t lastInsertRowId();

    /**
     * @brief Closes the connection. A no-op once closed.
     *
     * Every Statement prepared here must be destroyed first.
     *
     * @return false if the engine refused because statements are open; the
     * connection then stays usable.
     */
    bool close();

    const std::string& path() const noexcept { return dbPath; }

private:
    sqlite3* requireOpen(std::string_view action);
    void control(const char* sql, std::string_view verb);

    std::string dbPath;
    std::unique_ptr<sqlite3, decltype(&sqlite3_close_v2)> handle{
        nullptr, sqlite3_close_v2};
    std::atomic<bool> open{false};
};

}  // namespace strata::database::core

#endif  // STRATA_DATABASE_CORE_DATABASE_HPP
