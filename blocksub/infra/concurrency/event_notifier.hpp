// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <variant>

#include "task.hpp"

#include <boost/asio/any_io_executor.hpp>

#include "channel.hpp"

namespace blocksub::concurrency {

// A one-shot style notification in the spirit of Tokio Notify:
// a notify() before wait() is remembered, a single waiter is supported.
class EventNotifier {
  public:
    explicit EventNotifier(const boost::asio::any_io_executor& executor) : channel_(executor, 1) {}

    Task<void> wait() {
        co_await channel_.receive();
    }

    void notify() {
        channel_.try_send({});
    }

  private:
    Channel<std::monostate> channel_;
};

}  // namespace blocksub::concurrency
