// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2024-2025 YAMS Project Contributors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace qbroker::broker {

/**
 * @brief Owns the io_context and worker threads the broker runs on.
 *
 * Request execution (which blocks on a child process) and lease deadline
 * timers share this context. The broker sizes it at capacity + 1 threads so a
 * timer can always fire even when every slot is busy.
 *
 * ## Shutdown Behavior
 *
 * - `stop()`: Resets the work guard and stops the io_context; callers drain
 *   in-flight executions first
 * - `join()`: Blocks until all workers complete (safe for destruction)
 */
class WorkCoordinator {
public:
    WorkCoordinator();
    ~WorkCoordinator();

    WorkCoordinator(const WorkCoordinator&) = delete;
    WorkCoordinator& operator=(const WorkCoordinator&) = delete;
    WorkCoordinator(WorkCoordinator&&) = delete;
    WorkCoordinator& operator=(WorkCoordinator&&) = delete;

    /**
     * @brief Spawn @p numThreads workers running io_context.run().
     * @throws std::runtime_error if already started or thread creation fails
     */
    void start(std::size_t numThreads);

    /**
     * @brief Stop the io_context. Pending handlers are abandoned. Idempotent.
     */
    void stop();

    /**
     * @brief Wait for all workers. Call stop() first. Idempotent.
     */
    void join();

    [[nodiscard]] boost::asio::any_io_executor getExecutor() const noexcept;

    template <typename Fn> void post(Fn&& fn) const {
        boost::asio::post(ioContext_->get_executor(), std::forward<Fn>(fn));
    }

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] std::size_t getWorkerCount() const noexcept;

private:
    std::shared_ptr<boost::asio::io_context> ioContext_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;
    std::vector<std::thread> workers_;
    bool started_;
};

} // namespace qbroker::broker
