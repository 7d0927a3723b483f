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

#include "statement.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>

#include "database.hpp"

namespace strata::database::core {

Statement::Statement(Database& db, const std::string& sql)
    : connection(db.get()), sql(sql) {
    sqlite3_stmt* compiled = nullptr;
    const int rc = sqlite3_prepare_v2(connection, sql.c_str(),
                                      static_cast<int>(sql.size()), &compiled,
                                      nullptr);
    handle.reset(compiled);

    if (rc != SQLITE_OK) {
        auto error = engineError("Cannot prepare");
        spdlog::debug("{}", error);
        THROW_STATEMENT_PREPARE_ERROR(error);
    }
    if (!handle) {
        // Only whitespace or comments
        THROW_STATEMENT_PREPARE_ERROR("No statement in SQL text: \"" + sql +
                                      "\"");
    }
    spdlog::debug("Prepared: {}", sql);
}

std::string Statement::engineError(std::string_view what) const {
    std::string error(what);
    error += " \"";
    error += sql;
    error += "\": ";
    error += sqlite3_errmsg(connection);
    return error;
}

void Statement::requireParameter(int index) const {
    const int count = getParameterCount();
    if (index < 1 || index > count) {
        THROW_VALIDATION_ERROR("Placeholder " + std::to_string(index) +
                               " out of range 1.." + std::to_string(count) +
                               " in \"" + sql + "\"");
    }
}

void Statement::requireColumn(int column) const {
    const int count = getColumnCount();
    if (column < 0 || column >= count) {
        THROW_VALIDATION_ERROR("Column " + std::to_string(column) +
                               " out of range, result has " +
                               std::to_string(count) + " columns");
    }
}

Statement& Statement::checkBind(int result, int index, std::string_view kind) {
    if (result != SQLITE_OK) {
        auto error = engineError("Cannot bind " + std::string(kind) +
                                 " to placeholder " + std::to_string(index) +
                                 " of");
        spdlog::debug("{}", error);
        THROW_STATEMENT_PREPARE_ERROR(error);
    }
    return *this;
}

Statement& Statement::bind(int index, int value) {
    requireParameter(index);
    return checkBind(sqlite3_bind_int(handle.get(), index, value), index,
                     "int");
}

Statement& Statement::bind(int index, std::int64_t value) {
    requireParameter(index);
    return checkBind(sqlite3_bind_int64(handle.get(), index, value), index,
                     "int64");
}

Statement& Statement::bind(int index, double value) {
    requireParameter(index);
    return checkBind(sqlite3_bind_double(handle.get(), index, value), index,
                     "double");
}

Statement& Statement::bind(int index, const std::string& value) {
    requireParameter(index);
    return checkBind(
        sqlite3_bind_text(handle.get(), index, value.data(),
                          static_cast<int>(value.size()), SQLITE_TRANSIENT),
        index, "text");
}

Statement& Statement::bindNull(int index) {
    requireParameter(index);
    return checkBind(sqlite3_bind_null(handle.get(), index), index, "NULL");
}

Statement& Statement::bindValue(int index, const Value& value) {
    return std::visit(
        [this, index](const auto& v) -> Statement& {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return bindNull(index);
            } else if constexpr (std::is_same_v<T, bool>) {
                return bind(index, v ? 1 : 0);
            } else {
                return bind(index, v);
            }
        },
        value);
}

Statement& Statement::bindAll(const std::vector<Value>& values) {
    const int expected = getParameterCount();
    if (values.size() != static_cast<std::size_t>(expected)) {
        THROW_VALIDATION_ERROR("\"" + sql + "\" has " +
                               std::to_string(expected) +
                               " placeholders, got " +
                               std::to_string(values.size()) + " values");
    }
    for (int i = 0; i < expected; ++i) {
        bindValue(i + 1, values[static_cast<std::size_t>(i)]);
    }
    return *this;
}

bool Statement::step() {
    switch (sqlite3_step(handle.get())) {
        case SQLITE_ROW:
            return true;
        case SQLITE_DONE:
            return false;
        default: {
            auto error = engineError("Execution failed for");
            spdlog::debug("{}", error);
            THROW_SQL_EXECUTION_ERROR(error);
        }
    }
}

bool Statement::execute() {
    static_cast<void>(step());
    return true;
}

Statement& Statement::reset() {
    if (sqlite3_reset(handle.get()) != SQLITE_OK) {
        auto error = engineError("Cannot reset");
        spdlog::debug("{}", error);
        THROW_STATEMENT_PREPARE_ERROR(error);
    }
    return *this;
}

void Statement::clear() noexcept {
    static_cast<void>(sqlite3_reset(handle.get()));
    static_cast<void>(sqlite3_clear_bindings(handle.get()));
}

std::int64_t Statement::getInt64(int column) const {
    requireColumn(column);
    return sqlite3_column_int64(handle.get(), column);
}

double Statement::getDouble(int column) const {
    requireColumn(column);
    return sqlite3_column_double(handle.get(), column);
}

std::string Statement::getText(int column) const {
    requireColumn(column);
    // Fetch the text before its length, as sqlite3_column_bytes requires
    const auto* text = sqlite3_column_text(handle.get(), column);
    if (text == nullptr) {
        return {};
    }
    const int bytes = sqlite3_column_bytes(handle.get(), column);
    return {reinterpret_cast<const char*>(text),
            static_cast<std::size_t>(bytes)};
}

bool Statement::isNull(int column) const {
    requireColumn(column);
    return sqlite3_column_type(handle.get(), column) == SQLITE_NULL;
}

Value Statement::getValue(int column) const {
    requireColumn(column);
    switch (sqlite3_column_type(handle.get(), column)) {
        case SQLITE_NULL:
            return std::monostate{};
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(
                sqlite3_column_int64(handle.get(), column));
        case SQLITE_FLOAT:
            return sqlite3_column_double(handle.get(), column);
        case SQLITE_BLOB: {
            const void* bytes = sqlite3_column_blob(handle.get(), column);
            const int size = sqlite3_column_bytes(handle.get(), column);
            if (bytes == nullptr || size <= 0) {
                return std::string{};
            }
            return std::string(static_cast<const char*>(bytes),
                               static_cast<std::size_t>(size));
        }
        default:
            return getText(column);
    }
}

std::string Statement::getColumnName(int column) const {
    requireColumn(column);
    const char* name = sqlite3_column_name(handle.get(), column);
    return name != nullptr ? name : "";
}

Row Statement::getRow() const {
    Row row;
    for (int column = 0, count = getColumnCount(); column < count; ++column) {
        row.insert_or_assign(getColumnName(column), getValue(column));
    }
    return row;
}

int Statement::getColumnCount() const {
    return sqlite3_column_count(handle.get());
}

int Statement::getParameterCount() const {
    return sqlite3_bind_parameter_count(handle.get());
}

}  // namespace strata::database::core
