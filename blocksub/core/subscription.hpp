// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <functional>

#include <blocksub/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <blocksub/infra/concurrency/awaitable_condition_variable.hpp>
#include <blocksub/infra/concurrency/channel.hpp>
#include <blocksub/types/header.hpp>

namespace blocksub {

/**
 * Consumer handle of the accepted heads.
 *
 * Delivery is best effort: a head is handed over only if the consumer is waiting in receive()
 * at the time it's published, otherwise that head is skipped for this subscription.
 */
class Subscription {
  public:
    explicit Subscription(const boost::asio::any_io_executor& executor, std::function<void()> on_unsubscribe = {});

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    //! Next head, or nullptr once unsubscribed
    Task<HeaderPtr> receive();

    //! Completes once unsubscribed
    Task<void> done();

    //! Closes the subscription, only the first call has effect, thread-safe
    void unsubscribe();

    bool is_stopped() const { return stopped_; }

    //! Non blocking hand over to a consumer waiting in receive()
    bool try_deliver(const HeaderPtr& header);

  private:
    concurrency::Channel<HeaderPtr> channel_;
    concurrency::AwaitableConditionVariable done_cond_var_;
    std::atomic_bool stopped_{false};
    std::function<void()> on_unsubscribe_;
};

}  // namespace blocksub
