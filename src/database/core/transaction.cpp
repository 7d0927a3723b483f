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

#include "transaction.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

#include "database.hpp"

namespace strata::database::core {

Transaction::Transaction(Database& db) : db(db) { db.begin(); }

Transaction::Transaction(std::shared_ptr<Database> connection)
    : owner(std::move(connection)), db(*owner) {
    db.begin();
}

Transaction::~Transaction() {
    if (!isActive()) {
        return;
    }
    try {
        rollback();
    } catch (const StoreError& e) {
        spdlog::error("Rollback of abandoned transaction failed: {}",
                      e.what());
    }
}

void Transaction::requireActive(const char* action) const {
    if (!isActive()) {
        THROW_TRANSACTION_ERROR(
            std::string("Cannot ") + action + ": transaction already " +
            (state == State::Committed ? "committed" : "rolled back"));
    }
}

void Transaction::commit() {
    requireActive("commit");
    db.commit();
    state = State::Committed;
}

void Transaction::rollback() {
    requireActive("roll back");
    state = State::RolledBack;
    db.rollback();
}

}  // namespace strata::database::core
