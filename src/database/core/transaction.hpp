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

#ifndef STRATA_DATABASE_CORE_TRANSACTION_HPP
#define STRATA_DATABASE_CORE_TRANSACTION_HPP

#include <memory>

#include "types.hpp"

namespace strata::database::core {

class Database;

/**
 * @brief Scope guard over Database::begin/commit/rollback.
 *
 * The connection never rolls back on its own; holding one of these is how
 * a caller gets a rollback on every exit path that did not commit.
 *
 * @code
 * auto txn = db.beginTransaction();
 * db.execute("UPDATE accounts SET balance = balance - 10 WHERE id = 1");
 * db.execute("UPDATE accounts SET balance = balance + 10 WHERE id = 2");
 * txn->commit();
 * @endcode
 */
class Transaction {
public:
    /// Issues BEGIN. @throws TransactionError
    explicit Transaction(Database& db);

    /**
     * @brief Issues BEGIN and keeps the connection alive for the guard's
     * lifetime.
     *
     * If the owner closes the connection first, the final rollback fails
     * and is logged instead of touching a destroyed connection.
     *
     * @throws TransactionError
     */
    explicit Transaction(std::shared_ptr<Database> connection);

    /// Rolls back if still active. Never throws.
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /// @throws TransactionError if the engine refuses or the guard is done
    void commit();

    /**
     * @brief The guard is finished afterwards even if the engine reports
     * an error.
     *
     * @throws TransactionError
     */
    void rollback();

    [[nodiscard]] bool isActive() const noexcept {
        return state == State::Active;
    }

private:
    enum class State { Active, Committed, RolledBack };

    void requireActive(const char* action) const;

    std::shared_ptr<Database> owner;
    Database& db;
    State state = State::Active;
};

}  // namespace strata::database::core

#endif  // STRATA_DATABASE_CORE_TRANSACTION_HPP
