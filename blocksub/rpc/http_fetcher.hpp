// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <blocksub/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <blocksub/core/header_source.hpp>

#include "endpoint.hpp"

namespace blocksub::rpc {

//! HeaderFetcher polling eth_getBlockByNumber("latest") over HTTP, one connection per request
class JsonRpcHttpFetcher : public HeaderFetcher {
  public:
    //! \throws std::invalid_argument if endpoint is not an http one
    JsonRpcHttpFetcher(boost::asio::any_io_executor executor, Endpoint endpoint, std::chrono::milliseconds request_timeout);

    Task<HeaderPtr> latest_header() override;

    const Endpoint& endpoint() const { return endpoint_; }

  private:
    Task<std::string> post(const std::string& body);

    boost::asio::any_io_executor executor_;
    Endpoint endpoint_;
    std::chrono::milliseconds request_timeout_;
    std::atomic_uint64_t next_request_id_{1};
};

}  // namespace blocksub::rpc
