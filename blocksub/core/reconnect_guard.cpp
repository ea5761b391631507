// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "reconnect_guard.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <blocksub/infra/common/exception_ptr.hpp>
#include <blocksub/infra/common/log.hpp>
#include <blocksub/infra/concurrency/sleep.hpp>

namespace blocksub {

ReconnectGuard::ReconnectGuard(std::string name, ConnectFunc connect, Backoff backoff)
    : name_(std::move(name)),
      connect_(std::move(connect)),
      backoff_(backoff) {}

bool ReconnectGuard::is_connecting() {
    std::scoped_lock lock{mutex_};
    return is_connecting_;
}

Task<void> ReconnectGuard::attempt(bool retry_forever) {
    std::unique_lock lock{mutex_};
    if (is_connecting_) {
        auto waiter = connected_cond_var_.waiter();
        lock.unlock();
        BLOCKSUB_DEBUG_M("Reconnect already in progress", {"source", name_});
        co_await waiter();
        co_return;
    }
    is_connecting_ = true;
    lock.unlock();

    std::exception_ptr failure;
    auto delay = backoff_.min;
    while (true) {
        const auto attempt_number = ++attempts_;
        BLOCKSUB_INFO_M("Connecting", {"source", name_, "attempt", std::to_string(attempt_number)});

        std::exception_ptr error;
        try {
            co_await connect_();
        } catch (...) {
            error = std::current_exception();
        }
        if (!error) {
            ++connections_;
            BLOCKSUB_INFO_M("Connected", {"source", name_, "attempt", std::to_string(attempt_number)});
            break;
        }
        if (!retry_forever || is_operation_cancelled_error(error)) {
            failure = error;
            break;
        }

        BLOCKSUB_ERROR_M("Connection failed", {"source", name_,
                                               "error", describe_exception(error),
                                               "retry_in", std::to_string(delay.count()) + "ms"});
        try {
            co_await sleep(delay);
        } catch (...) {
            failure = std::current_exception();
            break;
        }
        delay = std::min(delay * 2, backoff_.max);
    }

    {
        std::scoped_lock release_lock{mutex_};
        is_connecting_ = false;
        connected_cond_var_.notify_all();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

}  // namespace blocksub
