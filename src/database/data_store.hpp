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

#ifndef STRATA_DATABASE_DATA_STORE_HPP
#define STRATA_DATABASE_DATA_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "cache/statement_cache.hpp"
#include "config.hpp"
#include "core/database.hpp"
#include "core/transaction.hpp"
#include "core/value.hpp"
#include "lifecycle/shutdown_registrar.hpp"
#include "query/clauses.hpp"
#include "query/query_builder.hpp"
#include "query/schema.hpp"

namespace strata::database {

/**
 * @brief Injection-safe table and row access over one SQLite file.
 *
 * A DataStore owns its connection, its prepared statement cache and the
 * registry of table schemas it created. Identifiers are validated before
 * any SQL is built and values are always bound, never spliced.
 *
 * Row and schema operations run synchronously on the calling thread and
 * hand back an already settled std::future; a failure is stored in the
 * future and rethrown by get() as ValidationError, SchemaError or
 * SqlExecutionError. The store stays usable after any failure.
 *
 * insert() and update() check only the in-memory registry, so a table
 * dropped through another connection is not noticed until the engine
 * reports it. select() and remove() ask the engine catalog every time.
 *
 * @par Usage Example:
 * @code
 * lifecycle::ShutdownCoordinator shutdown;
 * auto store = DataStore::open(config, shutdown);
 * store->prepareTable("users", schema).get();
 * store->insert("users", {{{"id", std::int64_t{1}}, {"name", "Ada"}}}).get();
 * auto rows = store->select("users", {"name"}).get();
 * @endcode
 */
class DataStore {
public:
    using Row = core::Row;
    using DataFrame = core::DataFrame;
    using RunSummary = core::RunSummary;

    /**
     * @brief Opens the store and registers its close job.
     *
     * The store is fully constructed before the job is handed to the
     * registrar. The job holds a weak reference, so it is harmless if the
     * store has already been destroyed when shutdown runs.
     *
     * @param config Location, cache size and pragmas.
     * @param registrar Receives the "Close DB '<name>'" job.
     * @param logger Destination for store messages; spdlog's default
     * logger when null.
     * @throws ValidationError for an invalid config
     * @throws DatabaseOpenError if the file cannot be opened
     */
    static std::shared_ptr<DataStore> open(
        const DatabaseConfig& config, lifecycle::ShutdownRegistrar& registrar,
        std::shared_ptr<spdlog::logger> logger = nullptr);

    ~DataStore();

    DataStore(const DataStore&) = delete;
    DataStore& operator=(const DataStore&) = delete;

    /**
     * @brief CREATE TABLE IF NOT EXISTS and remember the schema.
     *
     * Calling it again for an existing table changes nothing; the schema
     * registered first is kept.
     */
    std::future<void> prepareTable(const std::string& tableName,
                                   const query::TableSchema& schema);

    /**
     * @brief DROP TABLE IF EXISTS and forget the schema.
     *
     * Fails with SchemaError if the table was never prepared by this store.
     */
    std::future<void> deleteTable(const std::string& tableName);

    /**
     * @brief Asks the engine catalog whether the table exists.
     */
    std::future<bool> tableExists(const std::string& tableName);

    /**
     * @brief Fetches rows.
     *
     * @param columns Columns to return; empty means all.
     * @param limit Maximum rows; 0 or less means unbounded.
     * @param offset Rows to skip; 0 or less means none.
     */
    std::future<std::vector<Row>> select(
        const std::string& tableName, const std::vector<std::string>& columns,
        const query::Conditions& conditions = {}, std::int64_t limit = 0,
        std::int64_t offset = 0);

    /**
     * @brief Inserts rows that share one column set in a single statement.
     */
    std::future<RunSummary> insert(
        const std::string& tableName, const std::vector<DataFrame>& rows,
        const std::optional<query::ConflictPolicy>& conflict = std::nullopt);

    std::future<RunSummary> update(const std::string& tableName,
                                   const DataFrame& row,
                                   const query::Conditions& conditions);

    /**
     * @brief DELETE FROM with the given conditions; none deletes every row.
     */
    std::future<RunSummary> remove(const std::string& tableName,
                                   const query::Conditions& conditions);

    // Transactions are forwarded to the engine; pairing is up to the caller.

    /// @throws TransactionError
    void beginTransaction();
    /// @throws TransactionError
    void commitTransaction();
    /// @throws TransactionError
    void rollbackTransaction();

    /**
     * @brief Scoped transaction that rolls back unless committed.
     *
     * The guard shares the connection, so it may outlive the store. Once
     * the store has closed, its rollback only logs a failure; the engine
     * already discarded the uncommitted work when the connection closed.
     *
     * @throws SqlExecutionError if the store is closed
     * @throws TransactionError if the engine refuses BEGIN
     */
    std::unique_ptr<core::Transaction> transaction();

    /**
     * @brief Finalizes cached statements and closes the connection.
     *
     * Safe to call more than once.
     *
     * @return false if the engine refused to close.
     */
    bool close();

    [[nodiscard]] bool isOpen() const noexcept;
    [[nodiscard]] bool hasSchema(const std::string& tableName) const;
    [[nodiscard]] std::optional<query::TableSchema> schema(
        const std::string& tableName) const;
    [[nodiscard]] const cache::StatementCache& statementCache() const noexcept {
        return cache;
    }
    [[nodiscard]] std::size_t cacheSize() const noexcept {
        return cache.size();
    }
    [[nodiscard]] const std::filesystem::path& filePath() const noexcept {
        return path;
    }

private:
    DataStore(const DatabaseConfig& config,
              std::shared_ptr<spdlog::logger> logger);

    template <typename T>
    std::future<T> deferred(std::string_view operation,
                            const std::string& tableName,
                            const std::function<T()>& work);

    void runCached(const query::SqlQuery& query,
                   const std::function<void(core::Statement&)>& consume);
    std::vector<Row> runQuery(const query::SqlQuery& query);
    RunSummary runCommand(const query::SqlQuery& query);
    bool checkTableExists(const std::string& tableName);
    void requireRegistered(const std::string& tableName) const;
    void requireInCatalog(const std::string& tableName);
    void forward(void (core::Database::*step)(), std::string_view verb);

    std::string name;
    std::filesystem::path path;
    std::shared_ptr<spdlog::logger> log;
    // Shared with scoped transactions handed out by transaction()
    std::shared_ptr<core::Database> db;
    // Declared after db so cached statements are finalized first
    cache::StatementCache cache;
    std::unordered_map<std::string, query::TableSchema> tables;
};

}  // namespace strata::database

#endif  // STRATA_DATABASE_DATA_STORE_HPP
