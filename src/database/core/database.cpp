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

#include "database.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include "../query/identifier.hpp"
#include "statement.hpp"
#include "transaction.hpp"

namespace strata::database::core {

namespace {

bool isSignedInteger(std::string_view text) {
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        text.remove_prefix(1);
    }
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) {
               return std::isdigit(c) != 0;
           });
}

}  // namespace

Database::Database(const std::string& db_name, int flags) : dbPath(db_name) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(db_name.c_str(), &raw, flags, nullptr);
    handle.reset(raw);

    if (rc != SQLITE_OK) {
        std::string error = "Cannot open " + db_name + ": " +
                            (raw != nullptr ? sqlite3_errmsg(raw)
                                            : sqlite3_errstr(rc));
        spdlog::debug("{}", error);
        THROW_DATABASE_OPEN_ERROR(error);
    }

    open.store(true);
    try {
        execute("PRAGMA foreign_keys = ON;");
    } catch (const SqlExecutionError& e) {
        open.store(false);
        spdlog::debug("Cannot enable foreign keys on {}: {}", db_name,
                      e.what());
        THROW_DATABASE_OPEN_ERROR("Cannot enable foreign keys on " + db_name +
                                  ": " + e.what());
    }
    spdlog::info("Opened database {}", db_name);
}

Database::~Database() {
    if (!close()) {
        // sqlite3_close_v2 in the deleter finishes once the statements go
        spdlog::warn("Database {} destroyed with statements still open",
                     dbPath);
    }
}

sqlite3* Database::requireOpen(std::string_view action) {
    if (!open.load()) {
        THROW_SQL_EXECUTION_ERROR("Cannot " + std::string(action) + " on " +
                                  dbPath + ": connection is closed");
    }
    return handle.get();
}

sqlite3* Database::get() { return requireOpen("use handle"); }

std::unique_ptr<Statement> Database::prepare(const std::string& sql) {
    requireOpen("prepare statement");
    return std::make_unique<Statement>(*this, sql);
}

std::unique_ptr<Transaction> Database::beginTransaction() {
    requireOpen("begin transaction");
    return std::make_unique<Transaction>(*this);
}

void Database::execute(const std::string& sql) {
    sqlite3* conn = requireOpen("execute SQL");

    char* message = nullptr;
    const int rc =
        sqlite3_exec(conn, sql.c_str(), nullptr, nullptr, &message);
    if (rc == SQLITE_OK) {
        return;
    }

    std::string error = "SQL error in \"" + sql + "\": ";
    if (message != nullptr) {
        error += message;
        sqlite3_free(message);
    } else {
        error += sqlite3_errmsg(conn);
    }
    spdlog::debug("{}", error);
    THROW_SQL_EXECUTION_ERROR(error);
}

void Database::configure(const std::map<std::string, std::string>& pragmas) {
    requireOpen("configure");
    for (const auto& [name, value] : pragmas) {
        const bool safeValue =
            query::isPlainIdentifier(value) || isSignedInteger(value);
        if (!query::isPlainIdentifier(name) || !safeValue) {
            THROW_VALIDATION_ERROR("Rejected PRAGMA " + name + " = " + value);
        }
        execute("PRAGMA " + name + " = " + value + ";");
        spdlog::debug("PRAGMA {} = {} on {}", name, value, dbPath);
    }
}

void Database::setBusyTimeout(int milliseconds) {
    sqlite3* conn = requireOpen("set busy timeout");
    if (sqlite3_busy_timeout(conn, milliseconds) != SQLITE_OK) {
        std::string error = "Cannot set busy timeout on " + dbPath + ": " +
                            sqlite3_errmsg(conn);
        spdlog::debug("{}", error);
        THROW_SQL_EXECUTION_ERROR(error);
    }
}

void Database::control(const char* sql, std::string_view verb) {
    try {
        execute(sql);
    } catch (const StoreError& e) {
        spdlog::debug("Cannot {} transaction on {}: {}", verb, dbPath,
                      e.what());
        THROW_TRANSACTION_ERROR("Cannot " + std::string(verb) +
                                " transaction: " + e.what());
    }
    spdlog::debug("Transaction {} on {}", verb, dbPath);
}

void Database::begin() { control("BEGIN TRANSACTION;", "begin"); }

void Database::commit() { control("COMMIT;", "commit"); }

void Database::rollback() { control("ROLLBACK;", "roll back"); }

bool Database::inTransaction() {
    return sqlite3_get_autocommit(requireOpen("query transaction state")) == 0;
}

std::int64_t Database::changes() {
    return sqlite3_changes(requireOpen("count changes"));
}

std::int64_t Database::lastInsertRowId() {
    return sqlite3_last_insert_rowid(requireOpen("read last rowid"));
}

bool Database::close() {
    if (!open.load()) {
        return true;
    }

    try {
        execute("PRAGMA optimize;");
    } catch (const SqlExecutionError& e) {
        spdlog::warn("PRAGMA optimize failed on {}: {}", dbPath, e.what());
    }

    if (sqlite3_close(handle.get()) != SQLITE_OK) {
        spdlog::debug("Cannot close {}: {}", dbPath,
                      sqlite3_errmsg(handle.get()));
        return false;
    }
    // The engine already released it
    static_cast<void>(handle.release());
    open.store(false);
    spdlog::info("Closed database {}", dbPath);
    return true;
}

}  // namespace strata::database::core
