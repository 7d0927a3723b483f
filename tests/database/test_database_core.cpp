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
 * test_database_core.cpp
 *
 * Connection-level behaviour of core::Database
 * - Opening in memory and on disk
 * - Foreign keys enabled on open
 * - Running parameterless SQL
 * - Prepare statements
 * - Direct begin/commit/rollback forwarding
 * - PRAGMA configuration and rejection of unsafe PRAGMAs
 * - Close semantics
 * - Error handling
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <map>
#include <memory>
#include <sqlite3.h>

#include "database/core/database.hpp"
#include "database/core/statement.hpp"
#include "database/core/types.hpp"

using namespace strata::database::core;

// ==================== Connection Tests ====================

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = std::make_unique<Database>(":memory:");
    }

    void TearDown() override {
        db.reset();
    }

    std::int64_t count(const std::string& table) {
        auto stmt = db->prepare("SELECT COUNT(*) FROM " + table);
        EXPECT_TRUE(stmt->step());
        return stmt->getInt64(0);
    }

    std::unique_ptr<Database> db;
};

TEST_F(ConnectionTest, OpensInMemory) {
    EXPECT_TRUE(db->isValid());
    EXPECT_NE(db->get(), nullptr);
    EXPECT_EQ(db->path(), ":memory:");
}

TEST_F(ConnectionTest, ForeignKeysEnabledOnOpen) {
    auto stmt = db->prepare("PRAGMA foreign_keys");
    ASSERT_TRUE(stmt->step());
    EXPECT_EQ(stmt->getInt64(0), 1);
}

TEST_F(ConnectionTest, ForeignKeyViolationRejected) {
    db->execute("CREATE TABLE parent (id INTEGER PRIMARY KEY)");
    db->execute(
        "CREATE TABLE child (id INTEGER PRIMARY KEY, "
        "parent_id INTEGER REFERENCES parent(id))");

    EXPECT_THROW(db->execute("INSERT INTO child (parent_id) VALUES (42)"),
                 SqlExecutionError);
}

TEST_F(ConnectionTest, HandleIsStable) {
    sqlite3* raw = db->get();
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(raw, db->get());
    EXPECT_FALSE(db->inTransaction());
}

TEST_F(ConnectionTest, ExecuteRunsScript) {
    EXPECT_NO_THROW(db->execute(
        "CREATE TABLE notes (id INTEGER PRIMARY KEY, body TEXT);"
        "INSERT INTO notes (body) VALUES ('first');"
        "INSERT INTO notes (body) VALUES ('second');"));
    EXPECT_EQ(count("notes"), 2);
}

TEST_F(ConnectionTest, ExecuteReportsSyntaxError) {
    EXPECT_THROW(db->execute("SELEC 1"), SqlExecutionError);
}

TEST_F(ConnectionTest, PrepareCountsPlaceholders) {
    db->execute("CREATE TABLE tags (id INTEGER PRIMARY KEY, label TEXT)");

    auto stmt = db->prepare("INSERT INTO tags (id, label) VALUES (?, ?)");
    ASSERT_NE(stmt, nullptr);
    EXPECT_EQ(stmt->getParameterCount(), 2);
}

TEST_F(ConnectionTest, PrepareReportsUnknownTable) {
    EXPECT_THROW(db->prepare("SELECT * FROM nowhere"), StatementPrepareError);
}

TEST_F(ConnectionTest, ChangesAndLastInsertRowId) {
    db->execute("CREATE TABLE tags (id INTEGER PRIMARY KEY, label TEXT)");
    db->execute("INSERT INTO tags (label) VALUES ('a'), ('b'), ('c')");

    EXPECT_EQ(db->changes(), 3);
    EXPECT_EQ(db->lastInsertRowId(), 3);

    db->execute("DELETE FROM tags WHERE id > 1");
    EXPECT_EQ(db->changes(), 2);
}

TEST_F(ConnectionTest, ConfigureAppliesPragmas) {
    EXPECT_NO_THROW(db->configure({{"cache_size", "-2000"},
                                   {"temp_store", "MEMORY"},
                                   {"user_version", "+7"}}));

    auto stmt = db->prepare("PRAGMA user_version");
    ASSERT_TRUE(stmt->step());
    EXPECT_EQ(stmt->getInt64(0), 7);
}

TEST_F(ConnectionTest, ConfigureWithNothingIsNoOp) {
    EXPECT_NO_THROW(db->configure({}));
}

TEST_F(ConnectionTest, ConfigureRejectsUnsafePragma) {
    EXPECT_THROW(db->configure({{"synchronous", "OFF; DROP TABLE x"}}),
                 ValidationError);
    EXPECT_THROW(db->configure({{"foreign_keys = OFF;--", "ON"}}),
                 ValidationError);
}

TEST_F(ConnectionTest, CommitForwardsToEngine) {
    db->execute("CREATE TABLE ledger (id INTEGER PRIMARY KEY, entry TEXT)");

    db->begin();
    EXPECT_TRUE(db->inTransaction());
    db->execute("INSERT INTO ledger (entry) VALUES ('credit')");
    EXPECT_NO_THROW(db->commit());
    EXPECT_FALSE(db->inTransaction());

    EXPECT_EQ(count("ledger"), 1);
}

TEST_F(ConnectionTest, RollbackForwardsToEngine) {
    db->execute(
        "CREATE TABLE ledger (id INTEGER PRIMARY KEY, entry TEXT)");
    db->execute("INSERT INTO ledger (entry) VALUES ('opening')");

    db->begin();
    db->execute(
        "INSERT INTO ledger (entry) VALUES ('discarded')");
    EXPECT_NO_THROW(db->rollback());

    EXPECT_EQ(count("ledger"), 1);
}

TEST_F(ConnectionTest, BeginWhileOpenIsForwardedToEngine) {
    db->begin();
    // No nesting support: the engine refuses the second BEGIN
    EXPECT_THROW(db->begin(), TransactionError);
    // The first transaction is still usable
    EXPECT_TRUE(db->inTransaction());
    EXPECT_NO_THROW(db->rollback());
}

TEST_F(ConnectionTest, CommitWithoutTransactionThrows) {
    EXPECT_THROW(db->commit(), TransactionError);
    EXPECT_THROW(db->rollback(), TransactionError);
    EXPECT_FALSE(db->inTransaction());
}

TEST_F(ConnectionTest, ScopedGuardsInSequence) {
    for (int round = 0; round < 2; ++round) {
        auto guard = db->beginTransaction();
        ASSERT_NE(guard, nullptr);
        EXPECT_TRUE(db->inTransaction());
        guard->commit();
        EXPECT_FALSE(db->inTransaction());
    }
}

TEST_F(ConnectionTest, CloseInvalidatesConnection) {
    EXPECT_TRUE(db->close());
    EXPECT_FALSE(db->isValid());

    EXPECT_THROW(db->get(), SqlExecutionError);
    EXPECT_THROW(db->prepare("SELECT 1"), SqlExecutionError);
    EXPECT_THROW(db->execute("SELECT 1"), SqlExecutionError);
    EXPECT_THROW(db->beginTransaction(), SqlExecutionError);
    EXPECT_THROW(db->changes(), SqlExecutionError);
    // Begin is reported as a transaction failure
    EXPECT_THROW(db->begin(), TransactionError);

    // Second close is a no-op
    EXPECT_TRUE(db->close());
}

TEST_F(ConnectionTest, CloseRefusedWhileStatementsAreOpen) {
    auto stmt = db->prepare("SELECT 1");
    EXPECT_FALSE(db->close());
    EXPECT_TRUE(db->isValid());

    stmt.reset();
    EXPECT_TRUE(db->close());
}

TEST_F(ConnectionTest, MissingDirectoryFailsToOpen) {
    EXPECT_THROW(Database("/invalid/path/that/does/not/exist/db.sqlite"),
                 DatabaseOpenError);
}

TEST_F(ConnectionTest, ReadOnlyFlagRejectsWrites) {
    const auto file =
        std::filesystem::temp_directory_path() / "strata_readonly_test.db";
    std::filesystem::remove(file);
    {
        Database writer(file.string());
        writer.execute("CREATE TABLE t (x INTEGER)");
    }

    {
        Database reader(file.string(), SQLITE_OPEN_READONLY);
        EXPECT_TRUE(reader.isValid());
        EXPECT_THROW(reader.execute("INSERT INTO t (x) VALUES (1)"),
                     SqlExecutionError);
    }
    std::filesystem::remove(file);
}
