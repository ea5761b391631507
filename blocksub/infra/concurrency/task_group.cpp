// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "task_group.hpp"

#include <tuple>

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <blocksub/infra/common/assert.hpp>
#include <blocksub/infra/common/exception_ptr.hpp>
#include <blocksub/infra/common/log.hpp>

namespace blocksub::concurrency {

using namespace boost::asio;

void TaskGroup::spawn(const any_io_executor& executor, Task<void> task, std::string name) {
    std::scoped_lock lock(mutex_);

    if (is_closed_) {
        throw SpawnAfterCloseError();
    }

    auto task_id = ++last_task_id_;
    auto [it, ok] = tasks_.emplace(
        std::piecewise_construct,
        std::forward_as_tuple(task_id),
        std::forward_as_tuple());
    BLOCKSUB_ASSERT(ok);
    it->second.name = std::move(name);
    auto cancellation_slot = it->second.cancellation.slot();

    auto completion = [this, task_id](const std::exception_ptr& ex_ptr) {
        this->on_complete(task_id, ex_ptr);
    };

    co_spawn(executor, std::move(task), bind_cancellation_slot(cancellation_slot, completion));
}

Task<void> TaskGroup::wait() {
    std::exception_ptr ex_ptr;
    try {
        ex_ptr = co_await exceptions_.receive();
    } catch (const boost::system::system_error& ex) {
        if (ex.code() != boost::system::errc::operation_canceled) {
            BLOCKSUB_ERROR << "TaskGroup::wait system_error: " << ex.what();
            throw;
        }
        ex_ptr = std::current_exception();
    }

    co_await this_coro::reset_cancellation_state();
    close();

    while (!is_completed()) {
        auto [completed_task_id, result_ex_ptr] = co_await completions_.receive();
        {
            std::scoped_lock lock(mutex_);
            tasks_.erase(completed_task_id);
        }
        if (result_ex_ptr) {
            ex_ptr = result_ex_ptr;
        }
    }

    std::rethrow_exception(ex_ptr);
}

size_t TaskGroup::size() {
    std::scoped_lock lock(mutex_);
    return tasks_.size();
}

void TaskGroup::close() {
    std::scoped_lock lock(mutex_);
    is_closed_ = true;
    for (auto& [task_id, task] : tasks_) {
        task.cancellation.emit(cancellation_type::all);
    }
}

void TaskGroup::on_complete(size_t task_id, const std::exception_ptr& ex_ptr) {
    const bool is_failure = ex_ptr && !is_operation_cancelled_error(ex_ptr);

    std::scoped_lock lock(mutex_);
    if (is_failure) {
        const auto it = tasks_.find(task_id);
        BLOCKSUB_ERROR_M("Task failed", {"task", it != tasks_.end() ? it->second.name : "?", "error", describe_exception(ex_ptr)});
    }

    if (is_closed_) {
        // wait() is collecting completions, a failure during cancellation is rethrown from there
        if (!completions_.try_send({task_id, is_failure ? ex_ptr : std::exception_ptr{}})) {
            throw std::runtime_error("TaskGroup::on_complete: completions queue is full, max_tasks limit breached");
        }
    } else {
        tasks_.erase(task_id);
        if (is_failure) {
            exceptions_.try_send(ex_ptr);
        }
    }
}

bool TaskGroup::is_completed() {
    std::scoped_lock lock(mutex_);
    return is_closed_ && tasks_.empty();
}

}  // namespace blocksub::concurrency
