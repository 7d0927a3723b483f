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

#ifndef STRATA_DATABASE_CORE_VALUE_HPP
#define STRATA_DATABASE_CORE_VALUE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace strata::database::core {

/**
 * @brief A scalar that can be bound to a placeholder or read from a column.
 *
 * std::monostate stands for SQL NULL. Booleans are stored by the engine as
 * the integers 0 and 1, so they read back as std::int64_t.
 */
using Value = std::variant<std::monostate, bool, std::int64_t, double,
                           std::string>;

/// One row's fields for insert/update, keyed by column name.
using DataFrame = std::map<std::string, Value>;

/// One result row, keyed by column name.
using Row = std::map<std::string, Value>;

/// Outcome of a statement that does not return rows.
struct RunSummary {
    std::int64_t changes = 0;          ///< Rows inserted, updated or deleted.
    std::int64_t lastInsertRowId = 0;  ///< Rowid of the most recent insert.
};

[[nodiscard]] inline bool isNull(const Value& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Renders a value for log messages. Not an SQL literal.
 */
[[nodiscard]] inline std::string describe(const Value& value) {
    struct Visitor {
        std::string operator()(std::monostate) const { return "NULL"; }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
        std::string operator()(std::int64_t v) const {
            return std::to_string(v);
        }
        std::string operator()(double v) const { return std::to_string(v); }
        std::string operator()(const std::string& v) const {
            return "\"" + v + "\"";
        }
    };
    return std::visit(Visitor{}, value);
}

}  // namespace strata::database::core

#endif  // STRATA_DATABASE_CORE_VALUE_HPP
