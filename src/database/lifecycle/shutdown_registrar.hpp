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

#ifndef STRATA_DATABASE_LIFECYCLE_SHUTDOWN_REGISTRAR_HPP
#define STRATA_DATABASE_LIFECYCLE_SHUTDOWN_REGISTRAR_HPP

#include <functional>
#include <string>

namespace strata::database::lifecycle {

/// Teardown step; returns false if it could not complete.
using ShutdownJob = std::function<bool()>;

/**
 * @brief Accepts teardown jobs that must run once during graceful exit.
 */
class ShutdownRegistrar {
public:
    virtual ~ShutdownRegistrar() = default;

    /**
     * @brief Registers a job.
     *
     * @param job Invoked at most once.
     * @param label Human readable name used in log messages.
     */
    virtual void addJob(ShutdownJob job, std::string label) = 0;
};

}  // namespace strata::database::lifecycle

#endif  // STRATA_DATABASE_LIFECYCLE_SHUTDOWN_REGISTRAR_HPP
