// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <blocksub/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <blocksub/core/header_source.hpp>
#include <blocksub/core/queued_header_stream.hpp>

namespace blocksub::test_util {

inline HeaderPtr make_header(BlockNum number, const evmc::bytes32& hash) {
    return std::make_shared<const Header>(Header{.number = number, .hash = hash});
}

inline HeaderPtr make_header(BlockNum number) {
    return make_header(number, evmc::bytes32{number});
}

//! Fetcher answering with a settable header or error
class MockHeaderFetcher : public HeaderFetcher {
  public:
    Task<HeaderPtr> latest_header() override {
        ++calls_;
        if (on_call_) {
            on_call_();
        }
        std::unique_lock lock{mutex_};
        if (error_) {
            throw std::runtime_error(*error_);
        }
        co_return header_;
    }

    void set_header(HeaderPtr header) {
        std::scoped_lock lock{mutex_};
        header_ = std::move(header);
        error_.reset();
    }

    void fail_with(std::string message) {
        std::scoped_lock lock{mutex_};
        error_ = std::move(message);
    }

    //! Runs at the start of each latest_header() call, set it before the fetcher is in use
    void on_call(std::function<void()> callback) { on_call_ = std::move(callback); }

    size_t calls() const { return calls_; }

  private:
    std::function<void()> on_call_;
    std::mutex mutex_;
    HeaderPtr header_;
    std::optional<std::string> error_;
    std::atomic_size_t calls_{0};
};

//! Subscriber handing out QueuedHeaderStream-s the test feeds
class MockHeaderSubscriber : public HeaderSubscriber {
  public:
    explicit MockHeaderSubscriber(boost::asio::any_io_executor executor) : executor_(std::move(executor)) {}

    Task<std::shared_ptr<HeaderStream>> subscribe_new_heads() override {
        ++calls_;
        std::unique_lock lock{mutex_};
        if (failures_to_inject_ > 0) {
            --failures_to_inject_;
            throw std::runtime_error("connection refused");
        }
        auto stream = std::make_shared<QueuedHeaderStream>(executor_);
        streams_.push_back(stream);
        co_return stream;
    }

    //! The next count subscribe_new_heads() calls throw
    void fail_next(size_t count) {
        std::scoped_lock lock{mutex_};
        failures_to_inject_ = count;
    }

    //! Number of subscribe_new_heads() calls, failed ones included
    size_t calls() const { return calls_; }

    size_t streams_count() {
        std::scoped_lock lock{mutex_};
        return streams_.size();
    }

    std::shared_ptr<QueuedHeaderStream> stream(size_t index) {
        std::scoped_lock lock{mutex_};
        return streams_.at(index);
    }

  private:
    boost::asio::any_io_executor executor_;
    std::mutex mutex_;
    size_t failures_to_inject_{0};
    std::vector<std::shared_ptr<QueuedHeaderStream>> streams_;
    std::atomic_size_t calls_{0};
};

}  // namespace blocksub::test_util
