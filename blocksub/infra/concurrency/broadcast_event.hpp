// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <mutex>

#include "task.hpp"

#include "awaitable_condition_variable.hpp"

namespace blocksub::concurrency {

/**
 * A sticky event with any number of waiters.
 *
 * notify() wakes all the pending waiters, and every wait() started afterwards returns immediately.
 * Unlike EventNotifier, a single notification is observed by all the waiters.
 */
class BroadcastEvent {
  public:
    BroadcastEvent() = default;
    BroadcastEvent(const BroadcastEvent&) = delete;
    BroadcastEvent& operator=(const BroadcastEvent&) = delete;

    //! Thread-safe, repeated calls have no effect
    void notify();

    bool is_notified() const;

    Task<void> wait();

  private:
    mutable std::mutex mutex_;
    bool notified_{false};
    AwaitableConditionVariable notified_cond_var_;
};

}  // namespace blocksub::concurrency
