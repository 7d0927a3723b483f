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

#include "shutdown_coordinator.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <thread>

namespace strata::database::lifecycle {

namespace {

std::atomic<bool> g_shutdownRequested{false};

static_assert(std::atomic<bool>::is_always_lock_free,
              "shutdown flag must be usable from a signal handler");

void handleShutdownSignal(int /*signal*/) {
    ShutdownCoordinator::requestShutdown();
}

}  // namespace

//------------------------------------------------------------------------------
// ShutdownCoordinator Implementation
//------------------------------------------------------------------------------

ShutdownCoordinator::~ShutdownCoordinator() {
    if (!ran.load()) {
        run();
    }
}

void ShutdownCoordinator::addJob(ShutdownJob job, std::string label) {
    if (!job) {
        spdlog::warn("Ignoring empty shutdown job '{}'", label);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(jobsMutex);
        if (!ran.load()) {
            spdlog::debug("Registered shutdown job '{}'", label);
            jobs.emplace_back(std::move(job), std::move(label));
            return;
        }
    }
    spdlog::warn("Shutdown already ran, running job '{}' now", label);
    runJob(job, label);
}

std::size_t ShutdownCoordinator::run() {
    std::vector<std::pair<ShutdownJob, std::string>> pending;
    {
        std::lock_guard<std::mutex> lock(jobsMutex);
        if (ran.exchange(true)) {
            return 0;
        }
        pending.swap(jobs);
    }

    spdlog::info("Running {} shutdown jobs", pending.size());
    std::size_t failures = 0;
    for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
        if (!runJob(it->first, it->second)) {
            failures++;
        }
    }
    if (failures > 0) {
        spdlog::error("{} of {} shutdown jobs failed", failures,
                      pending.size());
    }
    return failures;
}

bool ShutdownCoordinator::runJob(const ShutdownJob& job,
                                 const std::string& label) {
    try {
        if (job()) {
            spdlog::info("Shutdown job '{}' done", label);
            return true;
        }
        spdlog::error("Shutdown job '{}' reported failure", label);
    } catch (const std::exception& e) {
        spdlog::error("Shutdown job '{}' threw: {}", label, e.what());
    }
    return false;
}

std::size_t ShutdownCoordinator::jobCount() const {
    std::lock_guard<std::mutex> lock(jobsMutex);
    return jobs.size();
}

void ShutdownCoordinator::installSignalHandlers() {
    std::signal(SIGINT, handleShutdownSignal);
    std::signal(SIGTERM, handleShutdownSignal);
}

void ShutdownCoordinator::requestShutdown() noexcept {
    g_shutdownRequested.store(true);
}

bool ShutdownCoordinator::shutdownRequested() noexcept {
    return g_shutdownRequested.load();
}

std::size_t ShutdownCoordinator::waitForShutdown(
    std::chrono::milliseconds pollInterval) {
    while (!g_shutdownRequested.exchange(false)) {
        std::this_thread::sleep_for(pollInterval);
    }
    spdlog::warn("Shutdown requested, releasing resources...");
    return run();
}

}  // namespace strata::database::lifecycle
