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

/**
 * @file store_usage.cpp
 * @brief Walks through the DataStore API on a small student registry.
 *
 * Usage: strata_store_demo [config.json] [--wait]
 *
 * With --wait the program keeps the store open until SIGINT or SIGTERM and
 * then lets the shutdown coordinator close it.
 */

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

#include "database/database.hpp"

using namespace strata::database;

namespace {

query::TableSchema studentSchema() {
    query::TableSchema schema;
    schema.columns.push_back({"id", query::SqlType::Integer, true, true});
    schema.columns.push_back({"name", query::SqlType::Text, false, true});
    schema.columns.push_back(
        {"grade", query::SqlType::Integer, false, false, Value{std::int64_t{1}}});
    return schema;
}

query::TableSchema enrollmentSchema() {
    query::TableSchema schema;
    schema.columns.push_back({"id", query::SqlType::Integer, true});
    query::ColumnDefinition student{"student_id", query::SqlType::Integer};
    student.notNull = true;
    student.foreignKey = query::ForeignKey{"students", "id",
                                           query::ForeignKeyAction::Cascade,
                                           query::ForeignKeyAction::NoAction};
    schema.columns.push_back(student);
    schema.columns.push_back({"course", query::SqlType::Text});
    return schema;
}

void printRows(const std::vector<Row>& rows) {
    for (const auto& row : rows) {
        std::string line;
        for (const auto& [column, value] : row) {
            line += column + "=" + core::describe(value) + " ";
        }
        spdlog::info("  {}", line);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto logger = spdlog::stdout_color_mt("strata");
    spdlog::set_default_logger(logger);

    DatabaseConfig config;
    config.name = "strata_demo";
    bool wait = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--wait") {
            wait = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [config.json] [--wait]\n";
            return 0;
        } else {
            config = DatabaseConfig::loadFromFile(arg);
        }
    }

    lifecycle::ShutdownCoordinator shutdown;
    shutdown.addJob(
        [] {
            spdlog::info("Shutting down...");
            return true;
        },
        "Msg");

    try {
        auto store = DataStore::open(config, shutdown, logger);

        store->prepareTable("students", studentSchema()).get();
        store->prepareTable("enrollments", enrollmentSchema()).get();

        store
            ->insert("students",
                     {{{"id", std::int64_t{1}}, {"name", std::string("Ada")}},
                      {{"id", std::int64_t{2}}, {"name", std::string("Alan")}}},
                     query::ConflictPolicy{query::ConflictAction::Ignore})
            .get();

        {
            auto txn = store->transaction();
            store
                ->insert("enrollments",
                         {{{"student_id", std::int64_t{1}},
                           {"course", std::string("Astronomy")}}})
                .get();
            txn->commit();
        }

        store
            ->update("students", {{"grade", std::int64_t{2}}},
                     {{"name", query::CompareOp::Like, std::string("A%")}})
            .get();

        auto rows = store->select("students", {}).get();
        spdlog::info("students ({} rows):", rows.size());
        printRows(rows);

        try {
            store->select("students; DROP TABLE students", {"id"}).get();
        } catch (const ValidationError& e) {
            spdlog::info("Rejected unsafe table name: {}", e.what());
        }

        if (wait) {
            lifecycle::ShutdownCoordinator::installSignalHandlers();
            spdlog::info("Press Ctrl+C to stop");
            return shutdown.waitForShutdown() == 0 ? 0 : 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    return shutdown.run() == 0 ? 0 : 1;
}
