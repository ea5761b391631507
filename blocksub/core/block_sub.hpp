// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include <blocksub/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <blocksub/infra/concurrency/broadcast_event.hpp>

#include "header_source.hpp"
#include "reconciler.hpp"
#include "settings.hpp"
#include "subscription.hpp"

namespace blocksub {

//! Counters exposed for monitoring
struct Stats {
    //! Number of the current head, 0 before the first accepted header
    BlockNum latest_block_number{0};
    uint64_t polls{0};
    uint64_t poll_failures{0};
    uint64_t pushed_headers{0};
    uint64_t accepted_headers{0};
    uint64_t reconnect_attempts{0};
    uint64_t reconnects{0};
    uint64_t forced_reconnects{0};
};

class BlockSubImpl;

/**
 * Tracks the chain head combining a polled source and a push subscription, and republishes
 * every new head to any number of subscriptions.
 *
 * Both sources are optional, at least one must be given. All the background work runs on a
 * strand of the given executor until stop() (or destruction).
 */
class BlockSub {
  public:
    //! \throws std::invalid_argument if neither fetcher nor subscriber is given
    BlockSub(const boost::asio::any_io_executor& executor,
             Settings settings,
             std::shared_ptr<HeaderFetcher> fetcher,
             std::shared_ptr<HeaderSubscriber> subscriber);
    ~BlockSub();

    BlockSub(const BlockSub&) = delete;
    BlockSub& operator=(const BlockSub&) = delete;

    //! Establishes the push subscription and fetches the first header, then keeps tracking in background.
    //! On failure nothing is left running and the error is rethrown.
    //! \throws std::logic_error if already started or stopped
    //! \throws boost::system::system_error with operation_canceled if stop() runs before start completes
    Task<void> start();

    //! Stops background work and closes all subscriptions. Idempotent, thread-safe.
    void stop();

    bool is_running() const;

    //! New subscription to the accepted heads, already closed after stop().
    //! If unsubscribe_signal is given, notifying it unsubscribes. A signal may be shared by many subscriptions.
    std::shared_ptr<Subscription> subscribe(std::shared_ptr<concurrency::BroadcastEvent> unsubscribe_signal = {});

    std::optional<HeadState> current_head() const;

    Stats stats() const;

  private:
    std::shared_ptr<BlockSubImpl> p_impl_;
};

}  // namespace blocksub
