// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <blocksub/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/signal_set.hpp>

namespace blocksub::cmd::common {

//! SIGINT/SIGTERM as an awaitable
class ShutdownSignal {
  public:
    explicit ShutdownSignal(const boost::asio::any_io_executor& executor)
        : signals_(executor, SIGINT, SIGTERM) {}

    using SignalNumber = int;

    Task<SignalNumber> wait_me();

    //! Waits for the first signal on the current executor
    static Task<SignalNumber> wait();

  private:
    boost::asio::signal_set signals_;
};

}  // namespace blocksub::cmd::common
