// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>

#include <blocksub/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

namespace blocksub::test_util {

/**
 * Runs Task-s on a private io_context polled from the test thread.
 * Background tasks spawned on executor() make progress only while run()
 * or poll_until() are polling.
 */
class TaskRunner {
  public:
    //! Run task to completion
    template <typename TResult>
    TResult run(Task<TResult> task) {
        auto future = spawn_future(std::move(task));
        poll_context_until_future_is_ready(future);
        return future.get();
    }

    template <typename TResult>
    std::future<TResult> spawn_future(Task<TResult> task) {
        return boost::asio::co_spawn(ioc_, std::move(task), boost::asio::use_future);
    }

    template <typename TResult>
    void poll_context_until_future_is_ready(std::future<TResult>& future) {
        using namespace std::chrono_literals;
        ioc_.restart();
        while (future.wait_for(0s) != std::future_status::ready) {
            ioc_.poll_one();
        }
    }

    //! Poll until the predicate holds or the deadline expires, returns the last predicate value
    template <typename Predicate>
    bool poll_until(Predicate predicate, std::chrono::milliseconds deadline = std::chrono::seconds{5}) {
        const auto expiry = std::chrono::steady_clock::now() + deadline;
        ioc_.restart();
        while (!predicate()) {
            if (std::chrono::steady_clock::now() > expiry) return predicate();
            ioc_.poll_one();
        }
        return true;
    }

    //! Poll for the given wall clock duration
    void poll_for(std::chrono::milliseconds duration) {
        const auto expiry = std::chrono::steady_clock::now() + duration;
        ioc_.restart();
        while (std::chrono::steady_clock::now() < expiry) {
            ioc_.poll_one();
        }
    }

    boost::asio::io_context& ioc() { return ioc_; }
    boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

  private:
    boost::asio::io_context ioc_;
};

}  // namespace blocksub::test_util
