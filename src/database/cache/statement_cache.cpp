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

#include "statement_cache.hpp"

#include <spdlog/spdlog.h>

#include "../core/types.hpp"

namespace strata::database::cache {

//------------------------------------------------------------------------------
// StatementCache Implementation
//------------------------------------------------------------------------------

StatementCache::StatementCache(std::size_t capacity) : maxSize(capacity) {
    if (capacity == 0) {
        THROW_VALIDATION_ERROR("Statement cache capacity must be at least 1");
    }
}

StatementCache::~StatementCache() { evictAll(); }

core::Statement* StatementCache::get(const std::string& sql) {
    auto it = statements.find(sql);
    if (it == statements.end()) {
        missCount++;
        return nullptr;
    }
    hitCount++;
    return it->second.get();
}

bool StatementCache::put(const std::string& sql,
                         std::unique_ptr<core::Statement> stmt) {
    if (!stmt) {
        spdlog::warn("Attempted to cache a null statement");
        return false;
    }

    statements.insert_or_assign(sql, std::move(stmt));
    if (statements.size() > maxSize) {
        spdlog::warn("Statement cache exceeded {} entries, flushing",
                     maxSize);
        evictAll();
        flushCount++;
        return true;
    }
    return false;
}

std::size_t StatementCache::evictAll() {
    const std::size_t released = statements.size();
    statements.clear();
    if (released > 0) {
        spdlog::debug("Finalized {} cached statements", released);
    }
    return released;
}

}  // namespace strata::database::cache
