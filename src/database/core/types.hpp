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

#ifndef STRATA_DATABASE_CORE_TYPES_HPP
#define STRATA_DATABASE_CORE_TYPES_HPP

#include "atom/error/exception.hpp"

namespace strata::database::core {

/**
 * @brief Root of every error raised by the store.
 *
 * Catch this to handle any store failure without caring which layer
 * produced it.
 */
class StoreError : public atom::error::Exception {
public:
    using Exception::Exception;
};

/// The file could not be opened or the connection could not be set up.
class DatabaseOpenError : public StoreError {
public:
    using StoreError::StoreError;
};

/// The engine rejected a statement at execution time.
class SqlExecutionError : public StoreError {
public:
    using StoreError::StoreError;
};

/// The engine failed to compile a statement or bind one of its parameters.
class StatementPrepareError : public StoreError {
public:
    using StoreError::StoreError;
};

class TransactionError : public StoreError {
public:
    using StoreError::StoreError;
};

/// Unsafe identifier or malformed request, raised before any SQL is sent.
class ValidationError : public StoreError {
public:
    using StoreError::StoreError;
};

/// The target table is unknown to the registry or to the engine catalog.
class SchemaError : public StoreError {
public:
    using StoreError::StoreError;
};

#define STRATA_THROW(ErrorType, ...)                                \
    throw strata::database::core::ErrorType(                        \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_DATABASE_OPEN_ERROR(...) \
    STRATA_THROW(DatabaseOpenError, __VA_ARGS__)
#define THROW_SQL_EXECUTION_ERROR(...) \
    STRATA_THROW(SqlExecutionError, __VA_ARGS__)
#define THROW_STATEMENT_PREPARE_ERROR(...) \
    STRATA_THROW(StatementPrepareError, __VA_ARGS__)
#define THROW_TRANSACTION_ERROR(...) \
    STRATA_THROW(TransactionError, __VA_ARGS__)
#define THROW_VALIDATION_ERROR(...) \
    STRATA_THROW(ValidationError, __VA_ARGS__)
#define THROW_SCHEMA_ERROR(...) STRATA_THROW(SchemaError, __VA_ARGS__)

}  // namespace strata::database::core

#endif  // STRATA_DATABASE_CORE_TYPES_HPP
