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

/*
 * test_query_builder.cpp
 *
 * Tests for the QueryBuilder class
 * - CREATE TABLE with types, keys, defaults and foreign keys
 * - DROP TABLE
 * - SELECT with columns, WHERE chains, LIMIT and OFFSET
 * - INSERT with multiple rows and conflict policies
 * - UPDATE and DELETE
 * - Validation of identifiers and shapes
 * - Enum string conversions
 */

#include <gtest/gtest.h>

#include "database/core/types.hpp"
#include "database/query/query_builder.hpp"

using namespace strata::database::query;
using namespace strata::database::core;

// ==================== QueryBuilder Tests ====================

class QueryBuilderTest : public ::testing::Test {
protected:
    static Value text(const char* s) { return Value{std::string(s)}; }
    static Value integer(std::int64_t v) { return Value{v}; }
};

TEST_F(QueryBuilderTest, ConstructorRejectsBadTableName) {
    EXPECT_NO_THROW(QueryBuilder("users"));
    EXPECT_THROW(QueryBuilder("users; DROP TABLE users"), ValidationError);
    EXPECT_THROW(QueryBuilder(""), ValidationError);
}

// ==================== CREATE / DROP Tests ====================

TEST_F(QueryBuilderTest, CreateTableSingleKey) {
    TableSchema schema;
    schema.columns.push_back({"id", SqlType::Integer, true, true});
    schema.columns.push_back({"name", SqlType::Text, false, true});
    schema.columns.push_back({"score", SqlType::Real});

    auto query = QueryBuilder("users").createTable(schema);
    EXPECT_EQ(query.sql,
              "CREATE TABLE IF NOT EXISTS users (id INTEGER NOT NULL PRIMARY "
              "KEY, name TEXT NOT NULL, score REAL)");
    EXPECT_TRUE(query.params.empty());
}

TEST_F(QueryBuilderTest, CreateTableCompositeKey) {
    TableSchema schema;
    schema.columns.push_back({"a", SqlType::Integer, true});
    schema.columns.push_back({"b", SqlType::Integer, true});

    auto query = QueryBuilder("pairs").createTable(schema);
    EXPECT_EQ(query.sql,
              "CREATE TABLE IF NOT EXISTS pairs (a INTEGER, b INTEGER, "
              "PRIMARY KEY (a, b))");
}

TEST_F(QueryBuilderTest, CreateTableDefaults) {
    TableSchema schema;
    schema.columns.push_back(
        {"label", SqlType::Text, false, false, text("it's")});
    schema.columns.push_back(
        {"active", SqlType::Boolean, false, false, Value{true}});
    schema.columns.push_back(
        {"count", SqlType::Integer, false, false, integer(-3)});
    schema.columns.push_back(
        {"ratio", SqlType::Real, false, false, Value{0.5}});
    schema.columns.push_back(
        {"note", SqlType::Text, false, false, Value{}});

    auto query = QueryBuilder("t").createTable(schema);
    EXPECT_EQ(query.sql,
              "CREATE TABLE IF NOT EXISTS t (label TEXT DEFAULT 'it''s', "
              "active BOOLEAN DEFAULT 1, count INTEGER DEFAULT -3, "
              "ratio REAL DEFAULT 0.5, note TEXT DEFAULT NULL)");
}

TEST_F(QueryBuilderTest, CreateTableForeignKey) {
    TableSchema schema;
    schema.columns.push_back({"id", SqlType::Integer, true});
    ColumnDefinition owner{"owner_id", SqlType::Integer};
    owner.foreignKey = ForeignKey{"users", "id", ForeignKeyAction::Cascade,
                                  ForeignKeyAction::SetNull};
    schema.columns.push_back(owner);

    auto query = QueryBuilder("items").createTable(schema);
    EXPECT_EQ(query.sql,
              "CREATE TABLE IF NOT EXISTS items (id INTEGER PRIMARY KEY, "
              "owner_id INTEGER REFERENCES users(id) ON DELETE CASCADE ON "
              "UPDATE SET NULL)");
}

TEST_F(QueryBuilderTest, CreateTableValidation) {
    EXPECT_THROW(QueryBuilder("t").createTable(TableSchema{}),
                 ValidationError);

    TableSchema duplicate;
    duplicate.columns.push_back({"a"});
    duplicate.columns.push_back({"a"});
    EXPECT_THROW(QueryBuilder("t").createTable(duplicate), ValidationError);

    TableSchema badColumn;
    badColumn.columns.push_back({"a'b"});
    EXPECT_THROW(QueryBuilder("t").createTable(badColumn), ValidationError);

    TableSchema badReference;
    ColumnDefinition ref{"p"};
    ref.foreignKey = ForeignKey{"users;", "id"};
    badReference.columns.push_back(ref);
    EXPECT_THROW(QueryBuilder("t").createTable(badReference),
                 ValidationError);
}

TEST_F(QueryBuilderTest, DropTable) {
    auto query = QueryBuilder("users").dropTable();
    EXPECT_EQ(query.sql, "DROP TABLE IF EXISTS users");
    EXPECT_TRUE(query.params.empty());
}

TEST_F(QueryBuilderTest, TableExistsBindsName) {
    auto query = QueryBuilder::tableExists("users");
    EXPECT_EQ(query.sql,
              "SELECT EXISTS(SELECT 1 FROM sqlite_master WHERE type = 'table' "
              "AND name = ?)");
    ASSERT_EQ(query.params.size(), 1u);
    EXPECT_TRUE(query.params[0] == text("users"));
}

// ==================== SELECT Tests ====================

TEST_F(QueryBuilderTest, SelectAllColumns) {
    auto query = QueryBuilder("users").select({});
    EXPECT_EQ(query.sql, "SELECT * FROM users");
    EXPECT_TRUE(query.params.empty());
}

TEST_F(QueryBuilderTest, SelectColumnsWithWhereChain) {
    Conditions where{
        {"age", CompareOp::Ge, integer(18)},
        {"name", CompareOp::Like, text("A%"), Connective::Or},
        {"active", CompareOp::Ne, Value{false}, Connective::And}};

    auto query = QueryBuilder("users").select({"id", "name"}, where);
    EXPECT_EQ(query.sql,
              "SELECT id, name FROM users WHERE (age >= ?) OR (name LIKE ?) "
              "AND (active != ?)");
    ASSERT_EQ(query.params.size(), 3u);
    EXPECT_TRUE(query.params[0] == integer(18));
    EXPECT_TRUE(query.params[1] == text("A%"));
    EXPECT_TRUE(query.params[2] == Value{false});
}

TEST_F(QueryBuilderTest, FirstConnectiveIgnored) {
    Conditions where{{"id", CompareOp::Eq, integer(1), Connective::Or}};
    auto query = QueryBuilder("users").select({"id"}, where);
    EXPECT_EQ(query.sql, "SELECT id FROM users WHERE (id = ?)");
}

TEST_F(QueryBuilderTest, ValuesNeverInlined) {
    Conditions where{
        {"name", CompareOp::Eq, text("x'); DROP TABLE users; --")}};
    auto query = QueryBuilder("users").select({}, where);
    EXPECT_EQ(query.sql.find("DROP"), std::string::npos);
    ASSERT_EQ(query.params.size(), 1u);
}

TEST_F(QueryBuilderTest, SelectLimitAndOffset) {
    auto both = QueryBuilder("users").select({}, {}, 10, 20);
    EXPECT_EQ(both.sql, "SELECT * FROM users LIMIT ? OFFSET ?");
    ASSERT_EQ(both.params.size(), 2u);
    EXPECT_TRUE(both.params[0] == integer(10));
    EXPECT_TRUE(both.params[1] == integer(20));

    auto limitOnly = QueryBuilder("users").select({}, {}, 5);
    EXPECT_EQ(limitOnly.sql, "SELECT * FROM users LIMIT ?");

    auto offsetOnly = QueryBuilder("users").select({}, {}, 0, 3);
    EXPECT_EQ(offsetOnly.sql, "SELECT * FROM users LIMIT -1 OFFSET ?");
    ASSERT_EQ(offsetOnly.params.size(), 1u);
    EXPECT_TRUE(offsetOnly.params[0] == integer(3));
}

TEST_F(QueryBuilderTest, NonPositiveLimitOffsetOmitted) {
    auto query = QueryBuilder("users").select({}, {}, 0, 0);
    EXPECT_EQ(query.sql, "SELECT * FROM users");

    auto negative = QueryBuilder("users").select({}, {}, -1, -5);
    EXPECT_EQ(negative.sql, "SELECT * FROM users");
    EXPECT_TRUE(negative.params.empty());
}

TEST_F(QueryBuilderTest, SelectRejectsBadColumns) {
    EXPECT_THROW(QueryBuilder("users").select({"id, name"}), ValidationError);
    EXPECT_THROW(QueryBuilder("users").select(
                     {}, {{"id = 1 OR 1", CompareOp::Eq, integer(1)}}),
                 ValidationError);
    EXPECT_NO_THROW(QueryBuilder("users").select({"*"}));
}

TEST_F(QueryBuilderTest, KeywordsNeverReachSqlText) {
    EXPECT_THROW(
        QueryBuilder("users").select({"pw FROM secrets UNION SELECT name"}),
        ValidationError);
    EXPECT_THROW(QueryBuilder("users").remove(
                     {{"id OR 1", CompareOp::Eq, integer(1)}}),
                 ValidationError);
    EXPECT_THROW(QueryBuilder("users").update(
                     {{"name", text("x")}},
                     {{"id OR 1", CompareOp::Eq, integer(1)}}),
                 ValidationError);
    EXPECT_THROW(QueryBuilder("users UNION users"), ValidationError);
}

// ==================== INSERT Tests ====================

TEST_F(QueryBuilderTest, InsertMultipleRows) {
    std::vector<DataFrame> rows{
        {{"name", text("Ada")}, {"id", integer(1)}},
        {{"id", integer(2)}, {"name", text("Alan")}}};

    auto query = QueryBuilder("users").insert(rows);
    EXPECT_EQ(query.sql, "INSERT INTO users (id, name) VALUES (?, ?), (?, ?)");
    ASSERT_EQ(query.params.size(), 4u);
    EXPECT_TRUE(query.params[0] == integer(1));
    EXPECT_TRUE(query.params[1] == text("Ada"));
    EXPECT_TRUE(query.params[2] == integer(2));
    EXPECT_TRUE(query.params[3] == text("Alan"));
}

TEST_F(QueryBuilderTest, InsertStatementLevelConflict) {
    std::vector<DataFrame> rows{{{"id", integer(1)}}};

    auto ignore = QueryBuilder("users").insert(
        rows, ConflictPolicy{ConflictAction::Ignore});
    EXPECT_EQ(ignore.sql, "INSERT OR IGNORE INTO users (id) VALUES (?)");

    auto replace = QueryBuilder("users").insert(
        rows, ConflictPolicy{ConflictAction::Replace, "id"});
    EXPECT_EQ(replace.sql, "INSERT OR REPLACE INTO users (id) VALUES (?)");

    auto rollback = QueryBuilder("users").insert(
        rows, ConflictPolicy{ConflictAction::Rollback});
    EXPECT_EQ(rollback.sql, "INSERT OR ROLLBACK INTO users (id) VALUES (?)");
}

TEST_F(QueryBuilderTest, InsertUpsertDoNothing) {
    std::vector<DataFrame> rows{{{"id", integer(1)}, {"name", text("x")}}};

    auto keyed = QueryBuilder("users").insert(
        rows, ConflictPolicy{ConflictAction::Nothing, "id"});
    EXPECT_EQ(keyed.sql,
              "INSERT INTO users (id, name) VALUES (?, ?) ON CONFLICT (id) DO "
              "NOTHING");

    auto unkeyed = QueryBuilder("users").insert(
        rows, ConflictPolicy{ConflictAction::Nothing});
    EXPECT_EQ(unkeyed.sql,
              "INSERT INTO users (id, name) VALUES (?, ?) ON CONFLICT DO "
              "NOTHING");
}

TEST_F(QueryBuilderTest, InsertUpsertDoUpdate) {
    std::vector<DataFrame> rows{
        {{"a", integer(1)}, {"b", integer(2)}, {"c", text("x")}}};

    auto query = QueryBuilder("t").insert(
        rows, ConflictPolicy{ConflictAction::Update, "(a, b)"});
    EXPECT_EQ(query.sql,
              "INSERT INTO t (a, b, c) VALUES (?, ?, ?) ON CONFLICT (a, b) DO "
              "UPDATE SET c = excluded.c");
}

TEST_F(QueryBuilderTest, InsertConflictKeyAsBareList) {
    std::vector<DataFrame> rows{
        {{"a", integer(1)}, {"b", integer(2)}, {"c", text("x")}}};

    auto query = QueryBuilder("t").insert(
        rows, ConflictPolicy{ConflictAction::Update, "a, b"});
    EXPECT_EQ(query.sql,
              "INSERT INTO t (a, b, c) VALUES (?, ?, ?) ON CONFLICT (a, b) DO "
              "UPDATE SET c = excluded.c");

    EXPECT_THROW(QueryBuilder("t").insert(
                     rows, ConflictPolicy{ConflictAction::Nothing, "a, select"}),
                 ValidationError);
}

TEST_F(QueryBuilderTest, InsertUpsertUpdateOnlyKeyColumns) {
    std::vector<DataFrame> rows{{{"id", integer(1)}}};
    auto query = QueryBuilder("t").insert(
        rows, ConflictPolicy{ConflictAction::Update, "id"});
    EXPECT_EQ(query.sql,
              "INSERT INTO t (id) VALUES (?) ON CONFLICT (id) DO NOTHING");
}

TEST_F(QueryBuilderTest, InsertValidation) {
    EXPECT_THROW(QueryBuilder("t").insert({}), ValidationError);
    EXPECT_THROW(QueryBuilder("t").insert({DataFrame{}}), ValidationError);

    std::vector<DataFrame> mismatched{{{"a", integer(1)}},
                                      {{"b", integer(2)}}};
    EXPECT_THROW(QueryBuilder("t").insert(mismatched), ValidationError);

    std::vector<DataFrame> badColumn{{{"a) VALUES (1); --", integer(1)}}};
    EXPECT_THROW(QueryBuilder("t").insert(badColumn), ValidationError);

    std::vector<DataFrame> rows{{{"a", integer(1)}}};
    EXPECT_THROW(
        QueryBuilder("t").insert(rows, ConflictPolicy{ConflictAction::Update}),
        ValidationError);
    EXPECT_THROW(QueryBuilder("t").insert(
                     rows, ConflictPolicy{ConflictAction::Nothing, "a;b"}),
                 ValidationError);
}

// ==================== UPDATE / DELETE Tests ====================

TEST_F(QueryBuilderTest, UpdateWithWhere) {
    DataFrame row{{"name", text("Grace")}, {"age", integer(40)}};
    Conditions where{{"id", CompareOp::Eq, integer(7)}};

    auto query = QueryBuilder("users").update(row, where);
    EXPECT_EQ(query.sql, "UPDATE users SET age = ?, name = ? WHERE (id = ?)");
    ASSERT_EQ(query.params.size(), 3u);
    EXPECT_TRUE(query.params[0] == integer(40));
    EXPECT_TRUE(query.params[1] == text("Grace"));
    EXPECT_TRUE(query.params[2] == integer(7));
}

TEST_F(QueryBuilderTest, UpdateValidation) {
    EXPECT_THROW(QueryBuilder("users").update({}, {}), ValidationError);
    EXPECT_THROW(QueryBuilder("users").update({{"a=1, b", integer(1)}}, {}),
                 ValidationError);
}

TEST_F(QueryBuilderTest, DeleteWithAndWithoutWhere) {
    auto all = QueryBuilder("users").remove({});
    EXPECT_EQ(all.sql, "DELETE FROM users");
    EXPECT_TRUE(all.params.empty());

    auto filtered = QueryBuilder("users").remove(
        {{"age", CompareOp::Lt, integer(18)},
         {"name", CompareOp::Eq, text("x"), Connective::Or}});
    EXPECT_EQ(filtered.sql,
              "DELETE FROM users WHERE (age < ?) OR (name = ?)");
    EXPECT_EQ(filtered.params.size(), 2u);
}

// ==================== Literal and Enum Tests ====================

TEST_F(QueryBuilderTest, ToLiteral) {
    EXPECT_EQ(QueryBuilder::toLiteral(Value{}), "NULL");
    EXPECT_EQ(QueryBuilder::toLiteral(Value{true}), "1");
    EXPECT_EQ(QueryBuilder::toLiteral(Value{false}), "0");
    EXPECT_EQ(QueryBuilder::toLiteral(integer(42)), "42");
    EXPECT_EQ(QueryBuilder::toLiteral(Value{2.5}), "2.5");
    EXPECT_EQ(QueryBuilder::toLiteral(text("O'Brien")), "'O''Brien'");
}

TEST_F(QueryBuilderTest, EnumStringConversions) {
    EXPECT_EQ(toString(CompareOp::Le), "<=");
    EXPECT_EQ(compareOpFromString("LIKE"), CompareOp::Like);
    EXPECT_THROW(compareOpFromString("=="), ValidationError);

    EXPECT_EQ(toString(Connective::Or), "OR");
    EXPECT_EQ(connectiveFromString("AND"), Connective::And);
    EXPECT_THROW(connectiveFromString("XOR"), ValidationError);

    EXPECT_EQ(toString(ConflictAction::Nothing), "NOTHING");
    EXPECT_EQ(conflictActionFromString("REPLACE"), ConflictAction::Replace);
    EXPECT_THROW(conflictActionFromString("MERGE"), ValidationError);

    EXPECT_EQ(toString(SqlType::Boolean), "BOOLEAN");
    EXPECT_EQ(sqlTypeFromString("REAL"), SqlType::Real);
    EXPECT_THROW(sqlTypeFromString("BLOB"), ValidationError);

    EXPECT_EQ(toString(ForeignKeyAction::SetNull), "SET NULL");
    EXPECT_EQ(foreignKeyActionFromString("RESTRICT"),
              ForeignKeyAction::Restrict);
    EXPECT_THROW(foreignKeyActionFromString("DELETE"), ValidationError);
}
