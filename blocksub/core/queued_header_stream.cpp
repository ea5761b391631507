// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "queued_header_stream.hpp"

#include <utility>

namespace blocksub {

QueuedHeaderStream::QueuedHeaderStream(const boost::asio::any_io_executor& executor,
                                       std::function<void()> on_close,
                                       size_t capacity)
    : channel_(executor, capacity),
      on_close_(std::move(on_close)) {}

Task<HeaderPtr> QueuedHeaderStream::next() {
    auto header = co_await channel_.receive_unless_closed();
    if (header) {
        co_return *header;
    }

    std::exception_ptr error;
    {
        std::scoped_lock lock{mutex_};
        error = error_;
    }
    if (error) {
        std::rethrow_exception(error);
    }
    co_return nullptr;
}

void QueuedHeaderStream::close() {
    if (end(nullptr) && on_close_) {
        on_close_();
    }
}

Task<void> QueuedHeaderStream::push(HeaderPtr header) {
    co_await channel_.send(std::move(header));
}

bool QueuedHeaderStream::try_push(HeaderPtr header) {
    return channel_.try_send(std::move(header));
}

void QueuedHeaderStream::finish() {
    end(nullptr);
}

void QueuedHeaderStream::fail(std::exception_ptr error) {
    end(std::move(error));
}

bool QueuedHeaderStream::is_ended() const {
    std::scoped_lock lock{mutex_};
    return ended_;
}

bool QueuedHeaderStream::end(std::exception_ptr error) {
    {
        std::scoped_lock lock{mutex_};
        if (ended_) return false;
        ended_ = true;
        error_ = std::move(error);
    }
    channel_.close();
    return true;
}

}  // namespace blocksub
