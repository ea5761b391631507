// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <utility>

#include "task.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace blocksub::concurrency {

//! Thread-safe channel. With no buffer (the default) a value is handed over only to a receiver already waiting.
template <typename T>
class Channel {
  public:
    explicit Channel(const boost::asio::any_io_executor& executor) : channel_(executor) {}
    Channel(const boost::asio::any_io_executor& executor, size_t max_buffer_size)
        : channel_(executor, max_buffer_size) {}

    //! Suspends until a receiver (or buffer slot) takes the value
    //! \throws boost::system::system_error with channel_closed after close(), operation_canceled on cancellation
    Task<void> send(T value) {
        try {
            co_await channel_.async_send(boost::system::error_code(), std::move(value), boost::asio::use_awaitable);
        } catch (const boost::system::system_error& ex) {
            rethrow_cancelled_as_operation_canceled(ex);
            throw;
        }
    }

    //! Non blocking send, false if nobody could take the value right now or the channel is closed
    bool try_send(T value) {
        return channel_.try_send(boost::system::error_code(), std::move(value));
    }

    //! \throws boost::system::system_error with channel_closed after close(), operation_canceled on cancellation
    Task<T> receive() {
        try {
            co_return (co_await channel_.async_receive(boost::asio::use_awaitable));
        } catch (const boost::system::system_error& ex) {
            rethrow_cancelled_as_operation_canceled(ex);
            throw;
        }
    }

    //! Like receive(), but a closed channel yields std::nullopt instead of throwing
    Task<std::optional<T>> receive_unless_closed() {
        try {
            co_return (co_await channel_.async_receive(boost::asio::use_awaitable));
        } catch (const boost::system::system_error& ex) {
            if (ex.code() == boost::asio::experimental::error::channel_closed) {
                co_return std::nullopt;
            }
            rethrow_cancelled_as_operation_canceled(ex);
            throw;
        }
    }

    bool is_open() const { return channel_.is_open(); }

    //! Wakes up pending receivers and senders with channel_closed
    void close() {
        channel_.close();
    }

  private:
    static void rethrow_cancelled_as_operation_canceled(const boost::system::system_error& ex) {
        if (ex.code() == boost::asio::experimental::error::channel_cancelled) {
            throw boost::system::system_error(make_error_code(boost::system::errc::operation_canceled));
        }
    }

    boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
};

}  // namespace blocksub::concurrency
