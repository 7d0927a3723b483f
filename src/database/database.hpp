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

#ifndef STRATA_DATABASE_HPP
#define STRATA_DATABASE_HPP

/**
 * @file database.hpp
 * @brief Single include for everything strata exposes.
 *
 * Pulls in the connection and statement wrappers, the SQL text builders,
 * the statement cache, the shutdown plumbing and DataStore itself.
 *
 * @code
 * using namespace strata::database;
 *
 * lifecycle::ShutdownCoordinator shutdown;
 * DatabaseConfig config;
 * config.name = "school";
 * auto store = DataStore::open(config, shutdown);
 *
 * query::TableSchema students{{
 *     {"id", query::SqlType::Integer, true},
 *     {"name", query::SqlType::Text, false, true},
 * }};
 * store->prepareTable("students", students).get();
 * store->insert("students", {{{"id", std::int64_t{1}}, {"name", "Ada"}}})
 *     .get();
 *
 * auto rows = store->select("students", {"name"},
 *                           {{"id", query::CompareOp::Eq, std::int64_t{1}}})
 *                 .get();
 * @endcode
 */

#include "core/database.hpp"
#include "core/statement.hpp"
#include "core/transaction.hpp"
#include "core/types.hpp"
#include "core/value.hpp"

#include "query/clauses.hpp"
#include "query/identifier.hpp"
#include "query/query_builder.hpp"
#include "query/schema.hpp"

#include "cache/statement_cache.hpp"

#include "lifecycle/shutdown_coordinator.hpp"
#include "lifecycle/shutdown_registrar.hpp"

#include "config.hpp"
#include "data_store.hpp"

namespace strata::database {

inline constexpr const char* STRATA_VERSION = "1.0.0";

[[nodiscard]] inline const char* version() noexcept { return STRATA_VERSION; }

using core::DataFrame;
using core::Row;
using core::RunSummary;
using core::Value;

using core::DatabaseOpenError;
using core::SchemaError;
using core::SqlExecutionError;
using core::StatementPrepareError;
using core::StoreError;
using core::TransactionError;
using core::ValidationError;

using DataStorePtr = std::shared_ptr<DataStore>;

}  // namespace strata::database

#endif  // STRATA_DATABASE_HPP
