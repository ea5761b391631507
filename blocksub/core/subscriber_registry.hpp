// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include <boost/asio/any_io_executor.hpp>

#include <blocksub/types/header.hpp>

#include "subscription.hpp"

namespace blocksub {

using SubscriptionId = uint64_t;

//! Live subscriptions indexed by a stable id
class SubscriberRegistry : public std::enable_shared_from_this<SubscriberRegistry> {
  public:
    explicit SubscriberRegistry(boost::asio::any_io_executor executor) : executor_(std::move(executor)) {}

    SubscriberRegistry(const SubscriberRegistry&) = delete;
    SubscriberRegistry& operator=(const SubscriberRegistry&) = delete;

    //! Registers a new subscription, removed from here when it's unsubscribed.
    //! Once closed, returns an already unsubscribed subscription.
    std::shared_ptr<Subscription> add();

    void remove(SubscriptionId id);

    //! Offers header to every live subscription without blocking
    //! \return the number of subscriptions which took it
    size_t fan_out(const HeaderPtr& header);

    //! Unsubscribes every live subscription and refuses new ones
    void close_all();

    size_t size() const;
    bool is_closed() const;

  private:
    boost::asio::any_io_executor executor_;
    mutable std::mutex mutex_;
    bool closed_{false};
    SubscriptionId last_id_{0};
    std::map<SubscriptionId, std::shared_ptr<Subscription>> subscriptions_;
};

}  // namespace blocksub
