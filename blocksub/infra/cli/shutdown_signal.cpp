// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "shutdown_signal.hpp"

#include <iostream>
#include <string>

#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <blocksub/infra/common/log.hpp>

namespace blocksub::cmd::common {

Task<ShutdownSignal::SignalNumber> ShutdownSignal::wait_me() {
    const int signal_number = co_await signals_.async_wait(boost::asio::use_awaitable);
    std::cout << "\n";
    BLOCKSUB_INFO_M("Signal caught", {"number", std::to_string(signal_number)});
    co_return signal_number;
}

Task<ShutdownSignal::SignalNumber> ShutdownSignal::wait() {
    auto executor = co_await boost::asio::this_coro::executor;
    ShutdownSignal signal{executor};
    co_return (co_await signal.wait_me());
}

}  // namespace blocksub::cmd::common
