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

#ifndef STRATA_DATABASE_CORE_STATEMENT_HPP
#define STRATA_DATABASE_CORE_STATEMENT_HPP

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "value.hpp"

namespace strata::database::core {

class Database;

/**
 * @brief One compiled SQL statement.
 *
 * Finalized on destruction. A Statement keeps the engine handle of the
 * connection it was prepared on, so it has to be destroyed before that
 * Database is closed.
 */
class Statement {
public:
    /**
     * @throws ValidationError if the connection is closed
     * @throws StatementPrepareError if the engine cannot compile sql or sql
     * holds no statement at all
     */
    Statement(Database& db, const std::string& sql);

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /// @name Binding
    /// Placeholders are numbered from 1. An index outside
    /// 1..getParameterCount() throws ValidationError; a value the engine
    /// refuses throws StatementPrepareError.
    /// @{
    Statement& bind(int index, int value);
    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::string& value);
    Statement& bindNull(int index);

    /// Dispatches on the held alternative. true/false bind as 1/0.
    Statement& bindValue(int index, const Value& value);
    /// @}

    /**
     * @brief Binds values[i] to placeholder i + 1.
     *
     * @throws ValidationError if values.size() != getParameterCount()
     */
    Statement& bindAll(const std::vector<Value>& values);

    /**
     * @brief Runs a statement whose rows, if any, are not wanted.
     *
     * Stops at the first row or at completion.
     *
     * @throws SqlExecutionError
     */
    bool execute();

    /**
     * @return true while a row is available, false once the statement is
     * done.
     * @throws SqlExecutionError
     */
    bool step();

    /// @throws StatementPrepareError if the last step had failed
    Statement& reset();

    /**
     * @brief Rewinds and unbinds without reporting anything.
     *
     * Meant for cleanup after a failed step, whose error sqlite3_reset()
     * would only repeat.
     */
    void clear() noexcept;

    /// @name Result columns
    /// Columns are numbered from 0 and read from the current row. An index
    /// outside 0..getColumnCount()-1 throws ValidationError.
    /// @{
    std::int64_t getInt64(int column) const;
    double getDouble(int column) const;
    /// NULL reads as an empty string.
    std::string getText(int column) const;
    bool isNull(int column) const;
    /// INTEGER, REAL, TEXT and NULL map to their Value alternative; a BLOB
    /// is returned as its raw bytes in a std::string.
    Value getValue(int column) const;
    std::string getColumnName(int column) const;
    /// @}

    /// Every column of the current row, keyed by column name.
    Row getRow() const;

    int getColumnCount() const;
    int getParameterCount() const;

    sqlite3_stmt* get() const { return handle.get(); }
    const std::string& getSql() const { return sql; }

private:
    void requireParameter(int index) const;
    void requireColumn(int column) const;
    Statement& checkBind(int result, int index, std::string_view kind);
    std::string engineError(std::string_view what) const;

    sqlite3* connection;
    std::string sql;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> handle{
        nullptr, sqlite3_finalize};
};

}  // namespace strata::database::core

#endif  // STRATA_DATABASE_CORE_STATEMENT_HPP
