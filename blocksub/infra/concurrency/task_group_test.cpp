// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "task_group.hpp"

#include <array>
#include <chrono>
#include <stdexcept>

#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>
#include <catch2/catch_test_macros.hpp>

#include <blocksub/infra/common/log.hpp>
#include <blocksub/infra/concurrency/sleep.hpp>
#include <blocksub/infra/test_util/log.hpp>
#include <blocksub/infra/test_util/task_runner.hpp>

namespace blocksub::concurrency {

using namespace std::chrono_literals;

class TestException : public std::runtime_error {
  public:
    TestException() : std::runtime_error("TestException") {}
};

static Task<void> async_ok() {
    co_await boost::asio::this_coro::executor;
}

static Task<void> async_throw_after(std::chrono::milliseconds delay) {
    co_await sleep(delay);
    throw TestException();
}

static Task<void> wait_until_cancelled(bool* is_cancelled) {
    try {
        co_await sleep(1h);
    } catch (const boost::system::system_error& ex) {
        *is_cancelled = (ex.code() == boost::system::errc::operation_canceled);
        throw;
    }
}

TEST_CASE("TaskGroup.task_failure_is_rethrown_from_wait") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    auto executor = runner.executor();
    TaskGroup group{executor, 4};
    std::array<bool, 2> is_cancelled{};
    group.spawn(executor, async_ok(), "ok");
    group.spawn(executor, wait_until_cancelled(&is_cancelled[0]), "waiter0");
    group.spawn(executor, wait_until_cancelled(&is_cancelled[1]), "waiter1");
    group.spawn(executor, async_throw_after(1ms), "thrower");

    CHECK_THROWS_AS(runner.run(group.wait()), TestException);
    CHECK(is_cancelled[0]);
    CHECK(is_cancelled[1]);
    CHECK(group.size() == 0);
}

TEST_CASE("TaskGroup.cancelling_wait_cancels_tasks") {
    test_util::TaskRunner runner;
    auto executor = runner.executor();
    TaskGroup group{executor, 2};
    std::array<bool, 2> is_cancelled{};
    group.spawn(executor, wait_until_cancelled(&is_cancelled[0]));
    group.spawn(executor, wait_until_cancelled(&is_cancelled[1]));

    boost::asio::cancellation_signal stop;
    auto future = boost::asio::co_spawn(
        executor, group.wait(),
        boost::asio::bind_cancellation_slot(stop.slot(), boost::asio::use_future));
    runner.poll_for(5ms);
    CHECK(group.size() == 2);

    stop.emit(boost::asio::cancellation_type::all);
    runner.poll_context_until_future_is_ready(future);
    CHECK_THROWS_AS(future.get(), boost::system::system_error);
    CHECK(is_cancelled[0]);
    CHECK(is_cancelled[1]);
}

TEST_CASE("TaskGroup.completed_tasks_leave_the_group") {
    test_util::TaskRunner runner;
    auto executor = runner.executor();
    TaskGroup group{executor, 3};
    group.spawn(executor, async_ok());
    group.spawn(executor, async_ok());
    CHECK(runner.poll_until([&] { return group.size() == 0; }));
}

TEST_CASE("TaskGroup.spawn_after_close_throws") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    auto executor = runner.executor();
    TaskGroup group{executor, 1};
    group.spawn(executor, async_throw_after(0ms));
    CHECK_THROWS_AS(runner.run(group.wait()), TestException);
    CHECK_THROWS_AS(group.spawn(executor, async_ok()), TaskGroup::SpawnAfterCloseError);
}

}  // namespace blocksub::concurrency
