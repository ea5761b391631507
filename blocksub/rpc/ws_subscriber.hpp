// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include <blocksub/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <blocksub/core/header_source.hpp>

#include "endpoint.hpp"

namespace blocksub::rpc {

/**
 * HeaderSubscriber using eth_subscribe("newHeads") over a websocket.
 *
 * Each subscribe_new_heads() opens a new connection. A reader task decodes the eth_subscription
 * notifications into the returned stream until the connection fails (abnormal end) or the
 * stream is closed by its consumer (the connection is then torn down).
 */
class JsonRpcWsSubscriber : public HeaderSubscriber {
  public:
    //! \throws std::invalid_argument if endpoint is not a ws one
    JsonRpcWsSubscriber(boost::asio::any_io_executor executor, Endpoint endpoint, std::chrono::milliseconds request_timeout);

    Task<std::shared_ptr<HeaderStream>> subscribe_new_heads() override;

    const Endpoint& endpoint() const { return endpoint_; }

  private:
    boost::asio::any_io_executor executor_;
    Endpoint endpoint_;
    std::chrono::milliseconds request_timeout_;
    std::atomic_uint64_t next_request_id_{1};
};

}  // namespace blocksub::rpc
