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

#ifndef STRATA_DATABASE_QUERY_CLAUSES_HPP
#define STRATA_DATABASE_QUERY_CLAUSES_HPP

#include <optional>
#include <string>
#include <vector>

#include "../core/types.hpp"
#include "../core/value.hpp"

namespace strata::database::query {

using core::Value;

/**
 * @brief Comparison operators allowed in a WHERE predicate.
 */
enum class CompareOp { Eq, Gt, Lt, Ge, Le, Ne, Like };

/**
 * @brief Joins a predicate to the one before it.
 */
enum class Connective { And, Or };

/**
 * @brief What to do when an INSERT hits a uniqueness constraint.
 *
 * Nothing and Update become an upsert clause, the others the engine's
 * statement-level "INSERT OR <action>" form.
 */
enum class ConflictAction { Rollback, Abort, Fail, Nothing, Update, Ignore, Replace };

[[nodiscard]] inline std::string toString(CompareOp op) {
    switch (op) {
        case CompareOp::Eq: return "=";
        case CompareOp::Gt: return ">";
        case CompareOp::Lt: return "<";
        case CompareOp::Ge: return ">=";
        case CompareOp::Le: return "<=";
        case CompareOp::Ne: return "!=";
        case CompareOp::Like: return "LIKE";
    }
    return "=";
}

[[nodiscard]] inline CompareOp compareOpFromString(const std::string& str) {
    if (str == "=") return CompareOp::Eq;
    if (str == ">") return CompareOp::Gt;
    if (str == "<") return CompareOp::Lt;
    if (str == ">=") return CompareOp::Ge;
    if (str == "<=") return CompareOp::Le;
    if (str == "!=") return CompareOp::Ne;
    if (str == "LIKE") return CompareOp::Like;
    THROW_VALIDATION_ERROR("Unknown comparison operator: " + str);
}

[[nodiscard]] inline std::string toString(Connective connective) {
    return connective == Connective::Or ? "OR" : "AND";
}

[[nodiscard]] inline Connective connectiveFromString(const std::string& str) {
    if (str == "AND") return Connective::And;
    if (str == "OR") return Connective::Or;
    THROW_VALIDATION_ERROR("Unknown logical operator: " + str);
}

[[nodiscard]] inline std::string toString(ConflictAction action) {
    switch (action) {
        case ConflictAction::Rollback: return "ROLLBACK";
        case ConflictAction::Abort: return "ABORT";
        case ConflictAction::Fail: return "FAIL";
        case ConflictAction::Nothing: return "NOTHING";
        case ConflictAction::Update: return "UPDATE";
        case ConflictAction::Ignore: return "IGNORE";
        case ConflictAction::Replace: return "REPLACE";
    }
    return "ABORT";
}

[[nodiscard]] inline ConflictAction conflictActionFromString(
    const std::string& str) {
    if (str == "ROLLBACK") return ConflictAction::Rollback;
    if (str == "ABORT") return ConflictAction::Abort;
    if (str == "FAIL") return ConflictAction::Fail;
    if (str == "NOTHING") return ConflictAction::Nothing;
    if (str == "UPDATE") return ConflictAction::Update;
    if (str == "IGNORE") return ConflictAction::Ignore;
    if (str == "REPLACE") return ConflictAction::Replace;
    THROW_VALIDATION_ERROR("Unknown conflict action: " + str);
}

/**
 * @brief One WHERE predicate: "(column op ?)".
 *
 * The connective links this predicate to the previous one and is ignored
 * on the first element of a sequence.
 */
struct Condition {
    std::string column;
    CompareOp op = CompareOp::Eq;
    Value value;
    Connective connective = Connective::And;
};

using Conditions = std::vector<Condition>;

/**
 * @brief Conflict resolution for INSERT.
 *
 * key names the conflict target: one column, "a, b" or "(a, b)". It is
 * required for Update and optional for Nothing; the statement-level
 * actions ignore it.
 */
struct ConflictPolicy {
    ConflictAction action = ConflictAction::Abort;
    std::optional<std::string> key;
};

}  // namespace strata::database::query

#endif  // STRATA_DATABASE_QUERY_CLAUSES_HPP
