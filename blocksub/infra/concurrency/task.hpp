// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <coroutine>

#include <boost/asio/awaitable.hpp>

// Task lives in the top-level namespace so that any component can write Task<void> foo();
namespace blocksub {

//! Asynchronous operation returned by any coroutine
template <typename T>
using Task = boost::asio::awaitable<T>;

}  // namespace blocksub
