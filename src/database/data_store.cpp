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

#include "data_store.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <type_traits>

#include "core/statement.hpp"
#include "core/types.hpp"

namespace strata::database {

//------------------------------------------------------------------------------
// DataStore Implementation
//------------------------------------------------------------------------------

std::shared_ptr<DataStore> DataStore::open(
    const DatabaseConfig& config, lifecycle::ShutdownRegistrar& registrar,
    std::shared_ptr<spdlog::logger> logger) {
    config.validate();

    // Fully built before anyone else can see it
    std::shared_ptr<DataStore> store(new DataStore(config, std::move(logger)));

    std::weak_ptr<DataStore> weak = store;
    registrar.addJob(
        [weak]() {
            if (auto alive = weak.lock()) {
                return alive->close();
            }
            return true;
        },
        "Close DB '" + config.name + "'");
    return store;
}

DataStore::DataStore(const DatabaseConfig& config,
                     std::shared_ptr<spdlog::logger> logger)
    : name(config.name),
      path(config.filePath()),
      log(logger ? std::move(logger) : spdlog::default_logger()),
      cache(config.cacheCapacity) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            log->error("DataStore: Cannot create directory {}: {}",
                       path.parent_path().string(), ec.message());
        }
    }

    try {
        db = std::make_shared<core::Database>(path.string());
        db->configure(config.pragmas);
        if (config.busyTimeoutMs > 0) {
            db->setBusyTimeout(config.busyTimeoutMs);
        }
    } catch (const std::exception& e) {
        log->error("DataStore: Failed to prepare database: {}", e.what());
        throw;
    }
    log->info("DataStore: Prepared database at {}", path.string());
}

DataStore::~DataStore() {
    if (!close()) {
        log->error("DataStore: Database {} was not closed cleanly", name);
    }
}

template <typename T>
std::future<T> DataStore::deferred(std::string_view operation,
                                   const std::string& tableName,
                                   const std::function<T()>& work) {
    std::promise<T> promise;
    auto future = promise.get_future();
    try {
        if constexpr (std::is_void_v<T>) {
            work();
            promise.set_value();
        } else {
            promise.set_value(work());
        }
    } catch (const core::ValidationError& e) {
        log->error("DataStore: Rejected {} on {}: {}", operation, tableName,
                   e.what());
        promise.set_exception(std::current_exception());
    } catch (const core::SchemaError& e) {
        log->error("DataStore: {} on {}: {}", operation, tableName, e.what());
        promise.set_exception(std::current_exception());
    } catch (const std::exception& e) {
        std::string msg = "Failed to " + std::string(operation) + " \"" +
                          tableName + "\": " + e.what();
        log->error("DataStore: {}", msg);
        promise.set_exception(std::make_exception_ptr(core::SqlExecutionError(
            ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, msg)));
    }
    return future;
}

void DataStore::runCached(
    const query::SqlQuery& query,
    const std::function<void(core::Statement&)>& consume) {
    if (auto* cached = cache.get(query.sql)) {
        log->debug("DataStore: Cache hit for {}", query.sql);
        try {
            cached->bindAll(query.params);
            consume(*cached);
        } catch (...) {
            cached->clear();
            throw;
        }
        cached->clear();
        return;
    }

    auto stmt = db->prepare(query.sql);
    try {
        stmt->bindAll(query.params);
        consume(*stmt);
    } catch (...) {
        stmt->clear();
        throw;
    }
    // Rewound so a cached statement never holds a read lock
    stmt->clear();
    cache.put(query.sql, std::move(stmt));
}

std::vector<DataStore::Row> DataStore::runQuery(const query::SqlQuery& query) {
    std::vector<Row> rows;
    runCached(query, [&rows](core::Statement& stmt) {
        while (stmt.step()) {
            rows.push_back(stmt.getRow());
        }
    });
    return rows;
}

DataStore::RunSummary DataStore::runCommand(const query::SqlQuery& query) {
    RunSummary summary;
    runCached(query, [this, &summary](core::Statement& stmt) {
        stmt.execute();
        summary.changes = db->changes();
        summary.lastInsertRowId = db->lastInsertRowId();
    });
    return summary;
}

bool DataStore::checkTableExists(const std::string& tableName) {
    auto rows = runQuery(query::QueryBuilder::tableExists(tableName));
    if (rows.empty() || rows.front().empty()) {
        return false;
    }
    const auto& flag = rows.front().begin()->second;
    return std::holds_alternative<std::int64_t>(flag) &&
           std::get<std::int64_t>(flag) == 1;
}

void DataStore::requireRegistered(const std::string& tableName) const {
    if (tables.find(tableName) == tables.end()) {
        THROW_SCHEMA_ERROR("Table " + tableName + " does not exist");
    }
}

void DataStore::requireInCatalog(const std::string& tableName) {
    if (!checkTableExists(tableName)) {
        THROW_SCHEMA_ERROR("Table " + tableName + " not found");
    }
}

std::future<void> DataStore::prepareTable(const std::string& tableName,
                                          const query::TableSchema& schema) {
    return deferred<void>("prepare table", tableName, [&]() {
        auto query = query::QueryBuilder(tableName).createTable(schema);
        db->execute(query.sql);
        if (!tables.try_emplace(tableName, schema).second) {
            log->debug("DataStore: Table \"{}\" already registered",
                       tableName);
        }
        log->info("DataStore: Table \"{}\" ready", tableName);
    });
}

std::future<void> DataStore::deleteTable(const std::string& tableName) {
    return deferred<void>("delete table", tableName, [&]() {
        auto query = query::QueryBuilder(tableName).dropTable();
        requireRegistered(tableName);
        db->execute(query.sql);
        tables.erase(tableName);
        log->info("DataStore: Table \"{}\" deleted", tableName);
    });
}

std::future<bool> DataStore::tableExists(const std::string& tableName) {
    return deferred<bool>("look up", tableName,
                          [&]() { return checkTableExists(tableName); });
}

std::future<std::vector<DataStore::Row>> DataStore::select(
    const std::string& tableName, const std::vector<std::string>& columns,
    const query::Conditions& conditions, std::int64_t limit,
    std::int64_t offset) {
    return deferred<std::vector<Row>>("fetch data from", tableName, [&]() {
        auto query = query::QueryBuilder(tableName).select(columns, conditions,
                                                           limit, offset);
        requireInCatalog(tableName);
        return runQuery(query);
    });
}

std::future<DataStore::RunSummary> DataStore::insert(
    const std::string& tableName, const std::vector<DataFrame>& rows,
    const std::optional<query::ConflictPolicy>& conflict) {
    return deferred<RunSummary>("insert into", tableName, [&]() {
        auto query = query::QueryBuilder(tableName).insert(rows, conflict);
        requireRegistered(tableName);
        return runCommand(query);
    });
}

std::future<DataStore::RunSummary> DataStore::update(
    const std::string& tableName, const DataFrame& row,
    const query::Conditions& conditions) {
    return deferred<RunSummary>("update data in", tableName, [&]() {
        auto query = query::QueryBuilder(tableName).update(row, conditions);
        requireRegistered(tableName);
        return runCommand(query);
    });
}

std::future<DataStore::RunSummary> DataStore::remove(
    const std::string& tableName, const query::Conditions& conditions) {
    return deferred<RunSummary>("delete data from", tableName, [&]() {
        auto query = query::QueryBuilder(tableName).remove(conditions);
        requireInCatalog(tableName);
        return runCommand(query);
    });
}

void DataStore::forward(void (core::Database::*step)(),
                        std::string_view verb) {
    try {
        ((*db).*step)();
    } catch (const core::StoreError& e) {
        log->error("DataStore: Cannot {} transaction: {}", verb, e.what());
        throw;
    }
}

void DataStore::beginTransaction() {
    forward(&core::Database::begin, "begin");
}

void DataStore::commitTransaction() {
    forward(&core::Database::commit, "commit");
}

void DataStore::rollbackTransaction() {
    forward(&core::Database::rollback, "roll back");
}

std::unique_ptr<core::Transaction> DataStore::transaction() {
    try {
        if (!db->isValid()) {
            THROW_SQL_EXECUTION_ERROR("Cannot begin transaction on " +
                                      path.string() +
                                      ": connection is closed");
        }
        return std::make_unique<core::Transaction>(db);
    } catch (const core::StoreError& e) {
        log->error("DataStore: Cannot open scoped transaction: {}", e.what());
        throw;
    }
}

bool DataStore::close() {
    if (!db || !db->isValid()) {
        return true;
    }
    cache.evictAll();
    if (!db->close()) {
        log->error("DataStore: Failed to close database {}", path.string());
        return false;
    }
    log->info("DataStore: Closed database {}", path.string());
    return true;
}

bool DataStore::isOpen() const noexcept { return db && db->isValid(); }

bool DataStore::hasSchema(const std::string& tableName) const {
    return tables.find(tableName) != tables.end();
}

std::optional<query::TableSchema> DataStore::schema(
    const std::string& tableName) const {
    auto it = tables.find(tableName);
    if (it == tables.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace strata::database
