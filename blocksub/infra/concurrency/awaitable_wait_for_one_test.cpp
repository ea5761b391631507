// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "awaitable_wait_for_one.hpp"

#include <chrono>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <blocksub/infra/concurrency/sleep.hpp>
#include <blocksub/infra/test_util/task_runner.hpp>

namespace blocksub::concurrency {

using namespace std::chrono_literals;
using namespace awaitable_wait_for_one;

static Task<int> value_after(std::chrono::milliseconds delay, int value) {
    co_await sleep(delay);
    co_return value;
}

static Task<int> throw_after(std::chrono::milliseconds delay) {
    co_await sleep(delay);
    throw std::runtime_error("stream broken");
}

TEST_CASE("wait_for_one.value_wins") {
    test_util::TaskRunner runner;
    auto result = runner.run(value_after(1ms, 42) || sleep(1h));
    REQUIRE(result.index() == 0);
    CHECK(std::get<0>(result) == 42);
}

TEST_CASE("wait_for_one.timeout_wins") {
    test_util::TaskRunner runner;
    auto result = runner.run(value_after(1h, 42) || sleep(1ms));
    CHECK(result.index() == 1);
}

TEST_CASE("wait_for_one.first_failure_is_rethrown") {
    test_util::TaskRunner runner;
    CHECK_THROWS_AS(runner.run(throw_after(1ms) || sleep(1h)), std::runtime_error);
}

TEST_CASE("wait_for_one.void_pair") {
    test_util::TaskRunner runner;
    auto result = runner.run(sleep(1h) || sleep(1ms));
    CHECK(result.index() == 1);
}

}  // namespace blocksub::concurrency
