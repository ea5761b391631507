// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include <blocksub/infra/concurrency/task.hpp>

#include <blocksub/infra/concurrency/awaitable_condition_variable.hpp>

namespace blocksub {

/**
 * Serializes (re)connection of the push source.
 *
 * The first caller of attempt() becomes the leader and runs the connect function; callers
 * arriving while the leader is connecting wait for it to finish and return without connecting.
 * A failed connect is retried with exponential backoff when retry_forever is set, otherwise
 * the error is rethrown to the leader. Cancellation is always propagated.
 */
class ReconnectGuard {
  public:
    using ConnectFunc = std::function<Task<void>()>;

    struct Backoff {
        std::chrono::milliseconds min{std::chrono::seconds{1}};
        std::chrono::milliseconds max{std::chrono::seconds{30}};
    };

    ReconnectGuard(std::string name, ConnectFunc connect, Backoff backoff);

    Task<void> attempt(bool retry_forever);

    bool is_connecting();

    //! Number of connect function invocations
    uint64_t attempts() const { return attempts_; }
    //! Number of successful connect function invocations
    uint64_t connections() const { return connections_; }

  private:
    std::string name_;
    ConnectFunc connect_;
    Backoff backoff_;

    std::mutex mutex_;
    bool is_connecting_{false};
    concurrency::AwaitableConditionVariable connected_cond_var_;

    std::atomic_uint64_t attempts_{0};
    std::atomic_uint64_t connections_{0};
};

}  // namespace blocksub
