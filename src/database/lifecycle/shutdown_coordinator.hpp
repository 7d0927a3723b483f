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

#ifndef STRATA_DATABASE_LIFECYCLE_SHUTDOWN_COORDINATOR_HPP
#define STRATA_DATABASE_LIFECYCLE_SHUTDOWN_COORDINATOR_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "shutdown_registrar.hpp"

namespace strata::database::lifecycle {

/**
 * @brief Runs registered teardown jobs exactly once.
 *
 * Jobs run in reverse registration order, so a resource registered after
 * the things it depends on is released before them. A job that returns
 * false or throws is logged and counted; the remaining jobs still run.
 * If run() was never called the destructor calls it.
 */
class ShutdownCoordinator : public ShutdownRegistrar {
public:
    ShutdownCoordinator() = default;
    ~ShutdownCoordinator() override;

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    /**
     * @brief Registers a job. After run() the job is executed immediately.
     */
    void addJob(ShutdownJob job, std::string label) override;

    /**
     * @brief Runs every job once. Later calls do nothing.
     *
     * @return Number of jobs that failed.
     */
    std::size_t run();

    [[nodiscard]] bool hasRun() const noexcept { return ran.load(); }

    [[nodiscard]] std::size_t jobCount() const;

    /**
     * @brief Routes SIGINT and SIGTERM to requestShutdown().
     */
    static void installSignalHandlers();

    /**
     * @brief Marks shutdown as requested. Async-signal-safe.
     */
    static void requestShutdown() noexcept;

    [[nodiscard]] static bool shutdownRequested() noexcept;

    /**
     * @brief Blocks until requestShutdown() is called or a handled signal
     * arrives, then runs the jobs.
     *
     * @param pollInterval How often the request flag is checked.
     * @return Number of jobs that failed.
     */
    std::size_t waitForShutdown(
        std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));

private:
    static bool runJob(const ShutdownJob& job, const std::string& label);

    mutable std::mutex jobsMutex;
    std::vector<std::pair<ShutdownJob, std::string>> jobs;
    std::atomic<bool> ran{false};
};

}  // namespace strata::database::lifecycle

#endif  // STRATA_DATABASE_LIFECYCLE_SHUTDOWN_COORDINATOR_HPP
