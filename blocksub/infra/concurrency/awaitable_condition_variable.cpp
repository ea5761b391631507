// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "awaitable_condition_variable.hpp"

#include <exception>

#include <boost/asio/this_coro.hpp>

namespace blocksub::concurrency {

AwaitableConditionVariable::Waiter AwaitableConditionVariable::waiter() {
    size_t waiter_version{0};
    {
        std::scoped_lock lock{mutex_};
        waiter_version = version_;
    }

    return [this, waiter_version]() -> Task<void> {
        auto executor = co_await boost::asio::this_coro::executor;

        decltype(waiters_)::iterator it;
        {
            std::scoped_lock lock{mutex_};
            // notified after waiter() but before suspension
            if (waiter_version != version_) {
                co_return;
            }
            it = waiters_.insert(waiters_.end(), std::make_unique<EventNotifier>(executor));
        }

        std::exception_ptr wait_error;
        try {
            co_await (*it)->wait();
        } catch (...) {
            wait_error = std::current_exception();
        }

        {
            std::scoped_lock lock{mutex_};
            waiters_.erase(it);
        }
        if (wait_error) {
            std::rethrow_exception(wait_error);
        }
    };
}

void AwaitableConditionVariable::notify_all() {
    std::scoped_lock lock{mutex_};
    ++version_;
    for (auto& waiter : waiters_) {
        waiter->notify();
    }
}

}  // namespace blocksub::concurrency
