// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "subscriber_registry.hpp"

#include <memory>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <blocksub/infra/test_util/task_runner.hpp>

namespace blocksub {

static HeaderPtr make_header(BlockNum number) {
    return std::make_shared<const Header>(Header{.number = number, .hash = evmc::bytes32{number}});
}

static Task<std::vector<BlockNum>> receive_numbers(std::shared_ptr<Subscription> subscription, size_t count) {
    std::vector<BlockNum> numbers;
    while (numbers.size() < count) {
        auto header = co_await subscription->receive();
        if (!header) break;
        numbers.push_back(header->number);
    }
    co_return numbers;
}

TEST_CASE("SubscriberRegistry.unsubscribe_removes_entry", "[core][registry]") {
    test_util::TaskRunner runner;
    auto registry = std::make_shared<SubscriberRegistry>(runner.executor());
    auto first = registry->add();
    auto second = registry->add();
    CHECK(registry->size() == 2);

    first->unsubscribe();
    CHECK(registry->size() == 1);
    first->unsubscribe();
    CHECK(registry->size() == 1);
    CHECK_FALSE(second->is_stopped());
}

TEST_CASE("SubscriberRegistry.close_all", "[core][registry]") {
    test_util::TaskRunner runner;
    auto registry = std::make_shared<SubscriberRegistry>(runner.executor());
    auto first = registry->add();
    auto second = registry->add();

    registry->close_all();
    CHECK(registry->is_closed());
    CHECK(registry->size() == 0);
    CHECK(first->is_stopped());
    CHECK(second->is_stopped());

    auto late = registry->add();
    CHECK(late->is_stopped());
    CHECK(registry->size() == 0);
    CHECK(runner.run(late->receive()) == nullptr);

    registry->close_all();
}

TEST_CASE("SubscriberRegistry.subscription_outlives_registry", "[core][registry]") {
    test_util::TaskRunner runner;
    auto registry = std::make_shared<SubscriberRegistry>(runner.executor());
    auto subscription = registry->add();
    registry.reset();
    subscription->unsubscribe();
    CHECK(subscription->is_stopped());
}

TEST_CASE("SubscriberRegistry.idle_subscriber_does_not_block_fan_out", "[core][registry]") {
    static constexpr size_t kHeaders{1000};
    test_util::TaskRunner runner;
    auto registry = std::make_shared<SubscriberRegistry>(runner.executor());
    auto reader = registry->add();
    auto idle = registry->add();

    auto future = runner.spawn_future(receive_numbers(reader, kHeaders));
    for (BlockNum number{1}; number <= kHeaders; ++number) {
        const auto header = make_header(number);
        // the reader takes it as soon as it's back in receive(), the idle one never does
        REQUIRE(runner.poll_until([&] { return registry->fan_out(header) == 1; }));
    }
    runner.poll_context_until_future_is_ready(future);

    const auto numbers = future.get();
    REQUIRE(numbers.size() == kHeaders);
    for (size_t i{0}; i < kHeaders; ++i) {
        CHECK(numbers[i] == i + 1);
    }
    CHECK_FALSE(idle->is_stopped());
    CHECK(registry->size() == 2);
}

}  // namespace blocksub
