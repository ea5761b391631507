// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "subscriber_registry.hpp"

#include <utility>
#include <vector>

namespace blocksub {

std::shared_ptr<Subscription> SubscriberRegistry::add() {
    std::scoped_lock lock{mutex_};
    if (closed_) {
        auto subscription = std::make_shared<Subscription>(executor_);
        subscription->unsubscribe();
        return subscription;
    }

    const auto id = ++last_id_;
    auto on_unsubscribe = [weak_self = weak_from_this(), id]() {
        if (auto self = weak_self.lock()) {
            self->remove(id);
        }
    };
    auto subscription = std::make_shared<Subscription>(executor_, std::move(on_unsubscribe));
    subscriptions_.emplace(id, subscription);
    return subscription;
}

void SubscriberRegistry::remove(SubscriptionId id) {
    std::scoped_lock lock{mutex_};
    subscriptions_.erase(id);
}

size_t SubscriberRegistry::fan_out(const HeaderPtr& header) {
    std::vector<std::shared_ptr<Subscription>> snapshot;
    {
        std::scoped_lock lock{mutex_};
        snapshot.reserve(subscriptions_.size());
        for (const auto& [id, subscription] : subscriptions_) {
            snapshot.push_back(subscription);
        }
    }

    size_t delivered{0};
    for (const auto& subscription : snapshot) {
        if (subscription->try_deliver(header)) {
            ++delivered;
        }
    }
    return delivered;
}

void SubscriberRegistry::close_all() {
    std::map<SubscriptionId, std::shared_ptr<Subscription>> subscriptions;
    {
        std::scoped_lock lock{mutex_};
        closed_ = true;
        subscriptions.swap(subscriptions_);
    }
    for (auto& [id, subscription] : subscriptions) {
        subscription->unsubscribe();
    }
}

size_t SubscriberRegistry::size() const {
    std::scoped_lock lock{mutex_};
    return subscriptions_.size();
}

bool SubscriberRegistry::is_closed() const {
    std::scoped_lock lock{mutex_};
    return closed_;
}

}  // namespace blocksub
