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

#include "query_builder.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <set>
#include <sstream>

#include "../core/types.hpp"
#include "identifier.hpp"

namespace strata::database::query {

namespace {

std::string escapeString(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 2);
    for (char c : str) {
        if (c == '\'') {
            result += "''";
        } else {
            result += c;
        }
    }
    return result;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) {
            out += ", ";
        }
        out += name;
    }
    return out;
}

bool isStatementLevel(ConflictAction action) {
    return action != ConflictAction::Nothing &&
           action != ConflictAction::Update;
}

}  // namespace

//------------------------------------------------------------------------------
// QueryBuilder Implementation
//------------------------------------------------------------------------------

QueryBuilder::QueryBuilder(const std::string& tableName)
    : tableName(tableName) {
    requireIdentifier(tableName, "table name");
}

std::string QueryBuilder::toLiteral(const core::Value& value) {
    struct Visitor {
        std::string operator()(std::monostate) const { return "NULL"; }
        std::string operator()(bool v) const { return v ? "1" : "0"; }
        std::string operator()(std::int64_t v) const {
            return std::to_string(v);
        }
        std::string operator()(double v) const {
            // Shortest round-trip form; NaN and infinities dump as null
            auto text = nlohmann::json(v).dump();
            return text == "null" ? "NULL" : text;
        }
        std::string operator()(const std::string& v) const {
            return "'" + escapeString(v) + "'";
        }
    };
    return std::visit(Visitor{}, value);
}

std::string QueryBuilder::columnDefinition(const ColumnDefinition& column,
                                           bool inlinePrimaryKey) {
    requireIdentifier(column.name, "column name");

    std::string def = column.name + " " + toString(column.type);
    if (column.notNull) {
        def += " NOT NULL";
    }
    if (column.primaryKey && inlinePrimaryKey) {
        def += " PRIMARY KEY";
    }
    if (column.defaultValue) {
        def += " DEFAULT " + toLiteral(*column.defaultValue);
    }
    if (column.foreignKey) {
        const auto& fk = *column.foreignKey;
        requireIdentifier(fk.references, "foreign key table");
        requireIdentifier(fk.column, "foreign key column");
        def += " REFERENCES " + fk.references + "(" + fk.column + ")";
        def += " ON DELETE " + toString(fk.onDelete);
        def += " ON UPDATE " + toString(fk.onUpdate);
    }
    return def;
}

SqlQuery QueryBuilder::createTable(const TableSchema& schema) const {
    if (schema.empty()) {
        THROW_VALIDATION_ERROR("Table " + tableName + " has no columns");
    }

    std::set<std::string> seen;
    std::vector<std::string> primaryKeys;
    for (const auto& column : schema.columns) {
        if (!seen.insert(column.name).second) {
            THROW_VALIDATION_ERROR("Duplicate column " + column.name +
                                   " in table " + tableName);
        }
        if (column.primaryKey) {
            primaryKeys.push_back(column.name);
        }
    }
    const bool inlinePrimaryKey = primaryKeys.size() <= 1;

    std::stringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << tableName << " (";
    bool first = true;
    for (const auto& column : schema.columns) {
        if (!first)
            sql << ", ";
        sql << columnDefinition(column, inlinePrimaryKey);
        first = false;
    }
    if (!inlinePrimaryKey) {
        sql << ", PRIMARY KEY (" << joinNames(primaryKeys) << ")";
    }
    sql << ")";

    return {sql.str(), {}};
}

SqlQuery QueryBuilder::dropTable() const {
    return {"DROP TABLE IF EXISTS " + tableName, {}};
}

SqlQuery QueryBuilder::tableExists(const std::string& tableName) {
    return {"SELECT EXISTS(SELECT 1 FROM sqlite_master "
            "WHERE type = 'table' AND name = ?)",
            {core::Value{tableName}}};
}

std::string QueryBuilder::whereClause(const Conditions& conditions,
                                      std::vector<core::Value>& params) {
    if (conditions.empty()) {
        return "";
    }

    std::stringstream sql;
    sql << " WHERE ";
    bool first = true;
    for (const auto& condition : conditions) {
        requireIdentifier(condition.column, "column name");
        if (!first)
            sql << " " << toString(condition.connective) << " ";
        sql << "(" << condition.column << " " << toString(condition.op)
            << " ?)";
        params.push_back(condition.value);
        first = false;
    }
    return sql.str();
}

SqlQuery QueryBuilder::select(const std::vector<std::string>& columns,
                              const Conditions& conditions, std::int64_t limit,
                              std::int64_t offset) const {
    SqlQuery query;
    std::stringstream sql;

    // SELECT clause
    sql << "SELECT ";
    if (columns.empty()) {
        sql << "*";
    } else {
        for (const auto& column : columns) {
            requireIdentifier(column, "column name");
        }
        sql << joinNames(columns);
    }

    // FROM clause
    sql << " FROM " << tableName;

    // WHERE clause
    sql << whereClause(conditions, query.params);

    // LIMIT clause
    if (limit > 0) {
        sql << " LIMIT ?";
        query.params.emplace_back(limit);
    } else if (offset > 0) {
        // The engine only accepts OFFSET after a LIMIT; -1 is unbounded
        sql << " LIMIT -1";
    }

    // OFFSET clause
    if (offset > 0) {
        sql << " OFFSET ?";
        query.params.emplace_back(offset);
    }

    query.sql = sql.str();
    return query;
}

SqlQuery QueryBuilder::insert(
    const std::vector<core::DataFrame>& rows,
    const std::optional<ConflictPolicy>& conflict) const {
    if (rows.empty()) {
        THROW_VALIDATION_ERROR("Nothing to insert into " + tableName);
    }

    std::vector<std::string> columns;
    for (const auto& [name, value] : rows.front()) {
        requireIdentifier(name, "column name");
        columns.push_back(name);
    }
    if (columns.empty()) {
        THROW_VALIDATION_ERROR("Row for " + tableName + " has no columns");
    }

    SqlQuery query;
    std::string placeholders = "(";
    for (size_t i = 0; i < columns.size(); ++i) {
        placeholders += i == 0 ? "?" : ", ?";
    }
    placeholders += ")";

    std::stringstream values;
    bool first = true;
    for (const auto& row : rows) {
        if (row.size() != columns.size() ||
            !std::equal(columns.begin(), columns.end(), row.begin(),
                        [](const std::string& name, const auto& field) {
                            return name == field.first;
                        })) {
            THROW_VALIDATION_ERROR(
                "All rows inserted into " + tableName +
                " must have the same columns as the first row");
        }
        for (const auto& [name, value] : row) {
            query.params.push_back(value);
        }
        if (!first)
            values << ", ";
        values << placeholders;
        first = false;
    }

    std::stringstream sql;
    sql << "INSERT ";
    if (conflict && isStatementLevel(conflict->action)) {
        sql << "OR " << toString(conflict->action) << " ";
    }
    sql << "INTO " << tableName << " (" << joinNames(columns) << ") VALUES "
        << values.str();

    if (conflict && !isStatementLevel(conflict->action)) {
        std::vector<std::string> keys;
        if (conflict->key) {
            keys = splitIdentifierList(*conflict->key);
        }

        sql << " ON CONFLICT";
        if (!keys.empty()) {
            sql << " (" << joinNames(keys) << ")";
        }

        std::vector<std::string> assignments;
        if (conflict->action == ConflictAction::Update) {
            if (keys.empty()) {
                THROW_VALIDATION_ERROR(
                    "ON CONFLICT DO UPDATE needs a conflict key for " +
                    tableName);
            }
            for (const auto& column : columns) {
                if (std::find(keys.begin(), keys.end(), column) ==
                    keys.end()) {
                    assignments.push_back(column + " = excluded." + column);
                }
            }
        }

        if (assignments.empty()) {
            sql << " DO NOTHING";
        } else {
            sql << " DO UPDATE SET " << joinNames(assignments);
        }
    }

    query.sql = sql.str();
    return query;
}

SqlQuery QueryBuilder::update(const core::DataFrame& row,
                              const Conditions& conditions) const {
    if (row.empty()) {
        THROW_VALIDATION_ERROR("Nothing to update in " + tableName);
    }

    SqlQuery query;
    std::stringstream sql;
    sql << "UPDATE " << tableName << " SET ";
    bool first = true;
    for (const auto& [name, value] : row) {
        requireIdentifier(name, "column name");
        if (!first)
            sql << ", ";
        sql << name << " = ?";
        query.params.push_back(value);
        first = false;
    }
    sql << whereClause(conditions, query.params);

    query.sql = sql.str();
    return query;
}

SqlQuery QueryBuilder::remove(const Conditions& conditions) const {
    SqlQuery query;
    query.sql = "DELETE FROM " + tableName;
    query.sql += whereClause(conditions, query.params);
    return query;
}

}  // namespace strata::database::query
