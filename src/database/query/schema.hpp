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

#ifndef STRATA_DATABASE_QUERY_SCHEMA_HPP
#define STRATA_DATABASE_QUERY_SCHEMA_HPP

#include <optional>
#include <string>
#include <vector>

#include "../core/types.hpp"
#include "../core/value.hpp"

namespace strata::database::query {

enum class SqlType { Null, Integer, Real, Text, Boolean };

enum class ForeignKeyAction { Cascade, SetNull, NoAction, Restrict };

[[nodiscard]] inline std::string toString(SqlType type) {
    switch (type) {
        case SqlType::Null: return "NULL";
        case SqlType::Integer: return "INTEGER";
        case SqlType::Real: return "REAL";
        case SqlType::Text: return "TEXT";
        case SqlType::Boolean: return "BOOLEAN";
    }
    return "TEXT";
}

[[nodiscard]] inline SqlType sqlTypeFromString(const std::string& str) {
    if (str == "NULL") return SqlType::Null;
    if (str == "INTEGER") return SqlType::Integer;
    if (str == "REAL") return SqlType::Real;
    if (str == "TEXT") return SqlType::Text;
    if (str == "BOOLEAN") return SqlType::Boolean;
    THROW_VALIDATION_ERROR("Unknown column type: " + str);
}

[[nodiscard]] inline std::string toString(ForeignKeyAction action) {
    switch (action) {
        case ForeignKeyAction::Cascade: return "CASCADE";
        case ForeignKeyAction::SetNull: return "SET NULL";
        case ForeignKeyAction::NoAction: return "NO ACTION";
        case ForeignKeyAction::Restrict: return "RESTRICT";
    }
    return "NO ACTION";
}

[[nodiscard]] inline ForeignKeyAction foreignKeyActionFromString(
    const std::string& str) {
    if (str == "CASCADE") return ForeignKeyAction::Cascade;
    if (str == "SET NULL") return ForeignKeyAction::SetNull;
    if (str == "NO ACTION") return ForeignKeyAction::NoAction;
    if (str == "RESTRICT") return ForeignKeyAction::Restrict;
    THROW_VALIDATION_ERROR("Unknown foreign key action: " + str);
}

struct ForeignKey {
    std::string references;  ///< Referenced table.
    std::string column;      ///< Referenced column.
    ForeignKeyAction onDelete = ForeignKeyAction::NoAction;
    ForeignKeyAction onUpdate = ForeignKeyAction::NoAction;
};

struct ColumnDefinition {
    std::string name;
    SqlType type = SqlType::Text;
    bool primaryKey = false;
    bool notNull = false;
    std::optional<core::Value> defaultValue;  ///< Written as an SQL literal.
    std::optional<ForeignKey> foreignKey;
};

/**
 * @brief Column definitions of one table, in declaration order.
 */
struct TableSchema {
    std::vector<ColumnDefinition> columns;

    [[nodiscard]] const ColumnDefinition* find(const std::string& name) const {
        for (const auto& column : columns) {
            if (column.name == name) {
                return &column;
            }
        }
        return nullptr;
    }

    [[nodiscard]] bool empty() const noexcept { return columns.empty(); }
};

}  // namespace strata::database::query

#endif  // STRATA_DATABASE_QUERY_SCHEMA_HPP
