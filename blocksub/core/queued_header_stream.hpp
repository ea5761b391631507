// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <functional>
#include <mutex>

#include <blocksub/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <blocksub/infra/concurrency/channel.hpp>

#include "header_source.hpp"

namespace blocksub {

/**
 * HeaderStream fed by a producer (a transport reader task or a test).
 *
 * The producer calls push() for each header, then either finish() for a clean end or fail()
 * for an abnormal one. The consumer close() ends the stream cleanly and runs the on_close hook
 * once, which lets the transport tear down its connection.
 */
class QueuedHeaderStream : public HeaderStream {
  public:
    static constexpr size_t kDefaultCapacity{64};

    explicit QueuedHeaderStream(const boost::asio::any_io_executor& executor,
                                std::function<void()> on_close = {},
                                size_t capacity = kDefaultCapacity);

    Task<HeaderPtr> next() override;
    void close() override;

    //! Waits for buffer space
    //! \throws boost::system::system_error once the stream is ended
    Task<void> push(HeaderPtr header);

    //! false if the buffer is full or the stream is ended
    bool try_push(HeaderPtr header);

    void finish();
    void fail(std::exception_ptr error);

    bool is_ended() const;

  private:
    //! true for the first caller only
    bool end(std::exception_ptr error);

    concurrency::Channel<HeaderPtr> channel_;
    std::function<void()> on_close_;
    mutable std::mutex mutex_;
    bool ended_{false};
    std::exception_ptr error_;
};

}  // namespace blocksub
