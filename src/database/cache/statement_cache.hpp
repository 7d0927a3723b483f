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

#ifndef STRATA_DATABASE_CACHE_STATEMENT_CACHE_HPP
#define STRATA_DATABASE_CACHE_STATEMENT_CACHE_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

#include "../core/statement.hpp"

namespace strata::database::cache {

/**
 * @brief Prepared statements keyed by their exact SQL text.
 *
 * The cache owns every statement it holds and finalizes them when they are
 * evicted. Eviction is all-or-nothing: when an insertion pushes the size
 * past the capacity, every statement is dropped, so the resident count
 * never exceeds the capacity once put() returns.
 *
 * Not synchronized. The owning data store runs on one connection and
 * callers that share it across threads must serialize access themselves.
 */
class StatementCache {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 512;

    /**
     * @param capacity Maximum resident statements, at least 1.
     * @throws ValidationError if capacity is 0
     */
    explicit StatementCache(std::size_t capacity = DEFAULT_CAPACITY);

    ~StatementCache();

    StatementCache(const StatementCache&) = delete;
    StatementCache& operator=(const StatementCache&) = delete;

    /**
     * @brief Looks up a statement.
     *
     * @param sql Exact SQL text.
     * @return The cached statement, or nullptr. The pointer stays valid
     * until the next put() or evictAll().
     */
    core::Statement* get(const std::string& sql);

    /**
     * @brief Stores a statement, replacing any with the same text.
     *
     * @return True if the insertion triggered a full flush, in which case
     * the statement just stored was finalized as well.
     */
    bool put(const std::string& sql, std::unique_ptr<core::Statement> stmt);

    /**
     * @brief Finalizes and drops every cached statement.
     *
     * @return Number of statements released.
     */
    std::size_t evictAll();

    [[nodiscard]] std::size_t size() const noexcept { return statements.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return maxSize; }
    [[nodiscard]] bool contains(const std::string& sql) const {
        return statements.count(sql) > 0;
    }

    [[nodiscard]] std::size_t hits() const noexcept { return hitCount; }
    [[nodiscard]] std::size_t misses() const noexcept { return missCount; }
    [[nodiscard]] std::size_t flushes() const noexcept { return flushCount; }

private:
    std::unordered_map<std::string, std::unique_ptr<core::Statement>>
        statements;
    std::size_t maxSize;
    std::size_t hitCount = 0;
    std::size_t missCount = 0;
    std::size_t flushCount = 0;
};

}  // namespace strata::database::cache

#endif  // STRATA_DATABASE_CACHE_STATEMENT_CACHE_HPP
