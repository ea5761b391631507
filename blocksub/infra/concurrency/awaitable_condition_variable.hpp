// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <list>
#include <memory>
#include <mutex>

#include "task.hpp"

#include "event_notifier.hpp"

namespace blocksub::concurrency {

/**
 * Condition variable for coroutines supporting any number of waiters.
 *
 * A waiter is bound to the notification version current at waiter() time, so a notify_all()
 * happening between waiter() and co_await waiter() is not lost.
 * Obtain the waiter under the same lock that guards the producer state:
 *
 *     std::unique_lock lock{mutex_};
 *     if (ready_) co_return;
 *     auto waiter = cond_var_.waiter();
 *     lock.unlock();
 *     co_await waiter();
 */
class AwaitableConditionVariable {
  public:
    using Waiter = std::function<Task<void>()>;

    AwaitableConditionVariable() = default;
    AwaitableConditionVariable(const AwaitableConditionVariable&) = delete;
    AwaitableConditionVariable& operator=(const AwaitableConditionVariable&) = delete;

    //! The returned waiter must not outlive this object
    Waiter waiter();

    void notify_all();

  private:
    std::mutex mutex_;
    std::list<std::unique_ptr<EventNotifier>> waiters_;
    size_t version_{0};
};

}  // namespace blocksub::concurrency
