// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "broadcast_event.hpp"

namespace blocksub::concurrency {

void BroadcastEvent::notify() {
    std::scoped_lock lock{mutex_};
    if (notified_) {
        return;
    }
    notified_ = true;
    notified_cond_var_.notify_all();
}

bool BroadcastEvent::is_notified() const {
    std::scoped_lock lock{mutex_};
    return notified_;
}

Task<void> BroadcastEvent::wait() {
    std::unique_lock lock{mutex_};
    if (notified_) {
        co_return;
    }
    auto waiter = notified_cond_var_.waiter();
    lock.unlock();
    co_await waiter();
}

}  // namespace blocksub::concurrency
