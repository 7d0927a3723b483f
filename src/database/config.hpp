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

#ifndef STRATA_DATABASE_CONFIG_HPP
#define STRATA_DATABASE_CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace strata::database {

using json = nlohmann::json;

/**
 * @brief Settings for one DataStore.
 */
struct DatabaseConfig {
    std::string name{"database"};  ///< File name without the .db extension
    std::string directory{"./"};   ///< Directory holding the file
    std::size_t cacheCapacity{512};  ///< Maximum cached prepared statements
    int busyTimeoutMs{0};            ///< Engine retry window on lock, 0 = off

    /// Extra PRAGMAs applied after opening. foreign_keys is always ON.
    std::map<std::string, std::string> pragmas{{"journal_mode", "WAL"},
                                               {"synchronous", "NORMAL"}};

    /**
     * @brief "<directory>/<name>.db"
     */
    [[nodiscard]] std::filesystem::path filePath() const;

    /**
     * @brief Checks the name and the cache capacity.
     *
     * @throws ValidationError
     */
    void validate() const;

    [[nodiscard]] json toJson() const;

    /**
     * @brief Reads the keys present in j over the defaults.
     *
     * @throws ValidationError if a key has the wrong JSON type
     */
    [[nodiscard]] static DatabaseConfig fromJson(const json& j);

    /**
     * @brief Parses a JSON file. Missing keys keep their defaults.
     *
     * @throws ValidationError if the file cannot be read or parsed
     */
    [[nodiscard]] static DatabaseConfig loadFromFile(
        const std::filesystem::path& path);
};

}  // namespace strata::database

#endif  // STRATA_DATABASE_CONFIG_HPP
