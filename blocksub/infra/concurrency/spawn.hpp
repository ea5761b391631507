// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <type_traits>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/execution/executor.hpp>
#include <boost/asio/is_executor.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace blocksub::concurrency {

template <typename Executor>
concept AsioExecutor = boost::asio::is_executor<Executor>::value || boost::asio::execution::is_executor<Executor>::value;

//! Runs f on ex (e.g. a strand) and awaits its result from the calling coroutine
template <AsioExecutor Executor, typename F>
auto spawn_task(const Executor& ex, F&& f) {
    return boost::asio::co_spawn(ex, std::forward<F>(f), boost::asio::use_awaitable);
}

}  // namespace blocksub::concurrency
