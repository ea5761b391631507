// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "subscription.hpp"

#include <utility>

namespace blocksub {

Subscription::Subscription(const boost::asio::any_io_executor& executor, std::function<void()> on_unsubscribe)
    : channel_(executor),
      on_unsubscribe_(std::move(on_unsubscribe)) {}

Task<HeaderPtr> Subscription::receive() {
    auto header = co_await channel_.receive_unless_closed();
    co_return header ? *header : nullptr;
}

Task<void> Subscription::done() {
    auto waiter = done_cond_var_.waiter();
    if (stopped_) {
        co_return;
    }
    co_await waiter();
}

void Subscription::unsubscribe() {
    bool expected{false};
    if (!stopped_.compare_exchange_strong(expected, true)) {
        return;
    }
    channel_.close();
    done_cond_var_.notify_all();
    if (on_unsubscribe_) {
        on_unsubscribe_();
    }
}

bool Subscription::try_deliver(const HeaderPtr& header) {
    if (stopped_) {
        return false;
    }
    return channel_.try_send(header);
}

}  // namespace blocksub
