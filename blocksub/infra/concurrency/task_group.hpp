// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "task.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/cancellation_signal.hpp>

#include <blocksub/infra/concurrency/channel.hpp>

namespace blocksub::concurrency {

/**
 * A dynamic set of tasks owned by a parent task.
 *
 * spawn() starts a task detached from the caller but tracked here until it completes.
 * wait() suspends until the parent is cancelled or one of the tasks fails; it then
 * cancels the pending tasks, waits for all of them to complete and rethrows.
 *
 * \code
 * Task<void> run() {
 *     tasks_.spawn(executor_, poll_loop(), "poll_loop");
 *     co_await tasks_.wait();
 * }
 * \endcode
 */
class TaskGroup {
  public:
    TaskGroup(const boost::asio::any_io_executor& executor, size_t max_tasks)
        : completions_(executor, max_tasks),
          exceptions_(executor, 1) {}

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    class SpawnAfterCloseError : public std::runtime_error {
      public:
        SpawnAfterCloseError() : std::runtime_error("TaskGroup can't spawn after it was closed") {}
    };

    //! co_spawn on executor, adding the task to this group until it completes
    //! \throws SpawnAfterCloseError once wait() started the cancellation
    void spawn(const boost::asio::any_io_executor& executor, Task<void> task, std::string name = "task");

    //! Waits until cancelled or a task throws, then cancels all pending tasks and waits for them
    Task<void> wait();

    //! Number of tasks not yet completed
    size_t size();

  private:
    void close();
    void on_complete(size_t task_id, const std::exception_ptr& ex_ptr);
    bool is_completed();

    struct TrackedTask {
        std::string name;
        boost::asio::cancellation_signal cancellation;
    };

    std::mutex mutex_;
    bool is_closed_{false};
    size_t last_task_id_{0};
    std::map<size_t, TrackedTask> tasks_;
    Channel<std::pair<size_t, std::exception_ptr>> completions_;
    Channel<std::exception_ptr> exceptions_;
};

}  // namespace blocksub::concurrency
