// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <utility>
#include <variant>

#include "task.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace blocksub::concurrency::awaitable_wait_for_one {

/**
 * Race of two tasks: the first one to complete decides the result and the other one is cancelled.
 * Unlike asio awaitable_operators, an exception also counts as completion and is rethrown,
 * so a failing task is never masked by the other one still pending.
 */
template <typename Executor>
boost::asio::awaitable<std::variant<std::monostate, std::monostate>, Executor> operator||(
    boost::asio::awaitable<void, Executor> t,
    boost::asio::awaitable<void, Executor> u) {
    using boost::asio::experimental::make_parallel_group;
    auto ex = co_await boost::asio::this_coro::executor;

    auto [order, ex0, ex1] =
        co_await make_parallel_group(
            boost::asio::co_spawn(ex, std::move(t), boost::asio::deferred),
            boost::asio::co_spawn(ex, std::move(u), boost::asio::deferred))
            .async_wait(boost::asio::experimental::wait_for_one(), boost::asio::use_awaitable_t<Executor>{});

    if (order[0] == 0) {
        if (ex0) std::rethrow_exception(ex0);
        co_return std::variant<std::monostate, std::monostate>{std::in_place_index<0>};
    }
    if (ex1) std::rethrow_exception(ex1);
    co_return std::variant<std::monostate, std::monostate>{std::in_place_index<1>};
}

//! Race of a value producing task against a void one, see above
template <typename T, typename Executor>
boost::asio::awaitable<std::variant<T, std::monostate>, Executor> operator||(
    boost::asio::awaitable<T, Executor> t,
    boost::asio::awaitable<void, Executor> u) {
    using boost::asio::experimental::make_parallel_group;
    using boost::asio::experimental::awaitable_operators::detail::awaitable_unwrap;
    using boost::asio::experimental::awaitable_operators::detail::awaitable_wrap;
    auto ex = co_await boost::asio::this_coro::executor;

    auto [order, ex0, r0, ex1] =
        co_await make_parallel_group(
            boost::asio::co_spawn(ex, awaitable_wrap(std::move(t)), boost::asio::deferred),
            boost::asio::co_spawn(ex, std::move(u), boost::asio::deferred))
            .async_wait(boost::asio::experimental::wait_for_one(), boost::asio::use_awaitable_t<Executor>{});

    if (order[0] == 0) {
        if (ex0) std::rethrow_exception(ex0);
        co_return std::variant<T, std::monostate>{std::in_place_index<0>, std::move(awaitable_unwrap<T>(r0))};
    }
    if (ex1) std::rethrow_exception(ex1);
    co_return std::variant<T, std::monostate>{std::in_place_index<1>};
}

}  // namespace blocksub::concurrency::awaitable_wait_for_one
