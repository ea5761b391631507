// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "awaitable_condition_variable.hpp"

#include <chrono>
#include <future>

#include <catch2/catch_test_macros.hpp>

#include <blocksub/infra/test_util/task_runner.hpp>

namespace blocksub::concurrency {

using namespace std::chrono_literals;

TEST_CASE("AwaitableConditionVariable.not_blocking_when_notified_before_waiting") {
    test_util::TaskRunner runner;
    AwaitableConditionVariable cond_var;
    auto waiter = cond_var.waiter();

    cond_var.notify_all();
    runner.run(waiter());
}

TEST_CASE("AwaitableConditionVariable.blocks_until_notified") {
    test_util::TaskRunner runner;
    AwaitableConditionVariable cond_var;
    auto waiter = cond_var.waiter();

    auto future = runner.spawn_future(waiter());
    while (runner.ioc().poll_one() > 0) {
    }
    CHECK(future.wait_for(0s) == std::future_status::timeout);

    cond_var.notify_all();
    runner.poll_context_until_future_is_ready(future);
}

TEST_CASE("AwaitableConditionVariable.notify_all_awakes_multiple_waiters") {
    test_util::TaskRunner runner;
    AwaitableConditionVariable cond_var;
    auto waiter1 = cond_var.waiter();
    auto waiter2 = cond_var.waiter();
    auto waiter3 = cond_var.waiter();

    auto future1 = runner.spawn_future(waiter1());
    auto future2 = runner.spawn_future(waiter2());
    auto future3 = runner.spawn_future(waiter3());
    while (runner.ioc().poll_one() > 0) {
    }

    cond_var.notify_all();
    runner.poll_context_until_future_is_ready(future1);
    runner.poll_context_until_future_is_ready(future2);
    runner.poll_context_until_future_is_ready(future3);
}

TEST_CASE("AwaitableConditionVariable.waiter_after_notify_blocks") {
    test_util::TaskRunner runner;
    AwaitableConditionVariable cond_var;
    cond_var.notify_all();
    auto waiter = cond_var.waiter();

    auto future = runner.spawn_future(waiter());
    while (runner.ioc().poll_one() > 0) {
    }
    CHECK(future.wait_for(0s) == std::future_status::timeout);

    cond_var.notify_all();
    runner.poll_context_until_future_is_ready(future);
}

}  // namespace blocksub::concurrency
