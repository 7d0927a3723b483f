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

#ifndef STRATA_DATABASE_QUERY_QUERY_BUILDER_HPP
#define STRATA_DATABASE_QUERY_QUERY_BUILDER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../core/value.hpp"
#include "clauses.hpp"
#include "schema.hpp"

namespace strata::database::query {

/**
 * @brief SQL text plus the values for its placeholders, in order.
 */
struct SqlQuery {
    std::string sql;
    std::vector<core::Value> params;
};

/**
 * @brief Builds the statements the data store runs against one table.
 *
 * Every identifier (table, column, foreign-key target, conflict key) is
 * checked with isValidIdentifier() before it is written into the SQL text;
 * a failure throws ValidationError and nothing is built. Values never
 * appear in the text, they are returned as bound parameters. The one
 * exception is column DEFAULT values, which the engine only accepts as
 * literals and which are encoded by toLiteral().
 */
class QueryBuilder {
public:
    /**
     * @brief Constructs a QueryBuilder for a specific table.
     *
     * @param tableName The name of the table to query.
     * @throws ValidationError if the name is not a valid identifier
     */
    explicit QueryBuilder(const std::string& tableName);

    /**
     * @brief CREATE TABLE IF NOT EXISTS with one definition per column.
     *
     * Each definition is "name TYPE [NOT NULL] [PRIMARY KEY] [DEFAULT lit]
     * [REFERENCES t(c) ON DELETE a ON UPDATE a]". When several columns are
     * flagged as primary key they are declared together as a table
     * constraint instead.
     *
     * @throws ValidationError on an empty schema or duplicate columns
     */
    SqlQuery createTable(const TableSchema& schema) const;

    /**
     * @brief DROP TABLE IF EXISTS.
     */
    SqlQuery dropTable() const;

    /**
     * @brief SELECT with optional WHERE, LIMIT and OFFSET.
     *
     * @param columns Columns to fetch; empty means "*".
     * @param conditions WHERE predicates, see whereClause().
     * @param limit Maximum rows; 0 or less means unbounded.
     * @param offset Rows to skip; 0 or less means none.
     */
    SqlQuery select(const std::vector<std::string>& columns,
                    const Conditions& conditions = {},
                    std::int64_t limit = 0, std::int64_t offset = 0) const;

    /**
     * @brief Multi-row INSERT sharing the first row's column list.
     *
     * @throws ValidationError if rows is empty, a row has no columns, or a
     * row's column set differs from the first row's
     */
    SqlQuery insert(const std::vector<core::DataFrame>& rows,
                    const std::optional<ConflictPolicy>& conflict =
                        std::nullopt) const;

    /**
     * @brief UPDATE ... SET col = ?, ... [WHERE ...].
     *
     * Parameters are the SET values followed by the WHERE values.
     */
    SqlQuery update(const core::DataFrame& row,
                    const Conditions& conditions) const;

    /**
     * @brief DELETE FROM ... [WHERE ...].
     */
    SqlQuery remove(const Conditions& conditions) const;

    /**
     * @brief Catalog lookup yielding a single 0/1 column.
     */
    static SqlQuery tableExists(const std::string& tableName);

    /**
     * @brief Renders " WHERE (c1 op ?) CONN (c2 op ?) ...".
     *
     * Returns an empty string for no conditions. The connective of element
     * i joins it to element i-1; the first element's connective is dropped.
     * Appends the compared values to params in placeholder order.
     */
    static std::string whereClause(const Conditions& conditions,
                                   std::vector<core::Value>& params);

    /**
     * @brief Encodes a value as an SQL literal for DEFAULT clauses.
     */
    static std::string toLiteral(const core::Value& value);

    const std::string& table() const noexcept { return tableName; }

private:
    std::string tableName;  ///< The name of the table.

    static std::string columnDefinition(const ColumnDefinition& column,
                                        bool inlinePrimaryKey);
};

}  // namespace strata::database::query

#endif  // STRATA_DATABASE_QUERY_QUERY_BUILDER_HPP
