// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "head_printer.hpp"

#include <string>

#include <boost/asio/this_coro.hpp>

#include <blocksub/common/util.hpp>
#include <blocksub/infra/common/log.hpp>
#include <blocksub/infra/concurrency/awaitable_wait_for_one.hpp>
#include <blocksub/infra/concurrency/task_group.hpp>

namespace blocksub::cmd {

static Task<void> print_subscription_heads(size_t index, std::shared_ptr<Subscription> subscription) {
    while (auto header = co_await subscription->receive()) {
        BLOCKSUB_INFO_M("New head", {"subscriber", std::to_string(index),
                                     "number", std::to_string(header->number),
                                     "hash", to_hex(header->hash)});
    }
    BLOCKSUB_DEBUG_M("Subscription closed", {"subscriber", std::to_string(index)});
}

static Task<void> all_closed(std::vector<std::shared_ptr<Subscription>> subscriptions) {
    for (const auto& subscription : subscriptions) {
        co_await subscription->done();
    }
}

Task<void> print_heads(std::vector<std::shared_ptr<Subscription>> subscriptions) {
    using namespace concurrency::awaitable_wait_for_one;
    auto executor = co_await boost::asio::this_coro::executor;

    concurrency::TaskGroup consumers{executor, subscriptions.size()};
    for (size_t i{0}; i < subscriptions.size(); ++i) {
        consumers.spawn(executor, print_subscription_heads(i, subscriptions[i]), "print_heads");
    }

    // consumers.wait() only returns on a consumer failure
    co_await (consumers.wait() || all_closed(std::move(subscriptions)));
}

}  // namespace blocksub::cmd
