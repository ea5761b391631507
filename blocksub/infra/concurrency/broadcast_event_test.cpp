// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "broadcast_event.hpp"

#include <chrono>
#include <future>

#include <catch2/catch_test_macros.hpp>

#include <blocksub/infra/test_util/task_runner.hpp>

namespace blocksub::concurrency {

using namespace std::chrono_literals;

TEST_CASE("BroadcastEvent.blocks_until_notified") {
    test_util::TaskRunner runner;
    BroadcastEvent event;

    auto future = runner.spawn_future(event.wait());
    while (runner.ioc().poll_one() > 0) {
    }
    CHECK(future.wait_for(0s) == std::future_status::timeout);
    CHECK_FALSE(event.is_notified());

    event.notify();
    CHECK(event.is_notified());
    runner.poll_context_until_future_is_ready(future);
}

TEST_CASE("BroadcastEvent.notify_awakes_all_waiters") {
    test_util::TaskRunner runner;
    BroadcastEvent event;

    auto future1 = runner.spawn_future(event.wait());
    auto future2 = runner.spawn_future(event.wait());
    auto future3 = runner.spawn_future(event.wait());
    while (runner.ioc().poll_one() > 0) {
    }

    event.notify();
    runner.poll_context_until_future_is_ready(future1);
    runner.poll_context_until_future_is_ready(future2);
    runner.poll_context_until_future_is_ready(future3);
}

TEST_CASE("BroadcastEvent.wait_after_notify_returns_immediately") {
    test_util::TaskRunner runner;
    BroadcastEvent event;
    event.notify();
    event.notify();

    runner.run(event.wait());
    runner.run(event.wait());
}

}  // namespace blocksub::concurrency
