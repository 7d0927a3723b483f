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

#include "config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

#include "core/types.hpp"
#include "query/identifier.hpp"

namespace strata::database {

namespace {

// PRAGMA values may be written as JSON strings or integers.
std::string pragmaValue(const std::string& key, const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return value.dump();
    }
    THROW_VALIDATION_ERROR("PRAGMA " + key +
                           " must be a string or an integer, got " +
                           value.type_name());
}

}  // namespace

std::filesystem::path DatabaseConfig::filePath() const {
    return std::filesystem::path(directory.empty() ? "./" : directory) /
           (name + ".db");
}

void DatabaseConfig::validate() const {
    if (!query::isPlainIdentifier(name)) {
        THROW_VALIDATION_ERROR("Invalid characters in db name: " + name);
    }
    if (cacheCapacity == 0) {
        THROW_VALIDATION_ERROR("cacheCapacity must be at least 1");
    }
    if (busyTimeoutMs < 0) {
        THROW_VALIDATION_ERROR("busyTimeoutMs must not be negative");
    }
}

json DatabaseConfig::toJson() const {
    return {{"name", name},
            {"directory", directory},
            {"cacheCapacity", cacheCapacity},
            {"busyTimeoutMs", busyTimeoutMs},
            {"pragmas", pragmas}};
}

DatabaseConfig DatabaseConfig::fromJson(const json& j) {
    DatabaseConfig cfg;
    try {
        cfg.name = j.value("name", cfg.name);
        cfg.directory = j.value("directory", cfg.directory);
        cfg.cacheCapacity = j.value("cacheCapacity", cfg.cacheCapacity);
        cfg.busyTimeoutMs = j.value("busyTimeoutMs", cfg.busyTimeoutMs);
        if (j.contains("pragmas")) {
            const auto& pragmas = j.at("pragmas");
            if (!pragmas.is_object()) {
                THROW_VALIDATION_ERROR("pragmas must be an object");
            }
            cfg.pragmas.clear();
            for (const auto& [key, value] : pragmas.items()) {
                cfg.pragmas[key] = pragmaValue(key, value);
            }
        }
    } catch (const json::exception& e) {
        spdlog::error("Invalid database config: {}", e.what());
        THROW_VALIDATION_ERROR("Invalid database config: " +
                               std::string(e.what()));
    }
    return cfg;
}

DatabaseConfig DatabaseConfig::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Cannot open database config {}", path.string());
        THROW_VALIDATION_ERROR("Cannot open database config " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to parse {}: {}", path.string(), e.what());
        THROW_VALIDATION_ERROR("Failed to parse " + path.string() + ": " +
                               e.what());
    }
    return fromJson(j);
}

}  // namespace strata::database
