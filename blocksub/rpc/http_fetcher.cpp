// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "http_fetcher.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <absl/strings/str_cat.h>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <blocksub/infra/common/log.hpp>

#include "json_rpc.hpp"

namespace blocksub::rpc {

namespace http = boost::beast::http;
using boost::asio::use_awaitable;

static constexpr uint32_t kMaxResponseSize{16 * 1024 * 1024};

JsonRpcHttpFetcher::JsonRpcHttpFetcher(boost::asio::any_io_executor executor,
                                       Endpoint endpoint,
                                       std::chrono::milliseconds request_timeout)
    : executor_(std::move(executor)),
      endpoint_(std::move(endpoint)),
      request_timeout_(request_timeout) {
    if (endpoint_.scheme != "http") {
        throw std::invalid_argument(absl::StrCat("JsonRpcHttpFetcher: http endpoint expected, got ", endpoint_.to_string()));
    }
}

Task<HeaderPtr> JsonRpcHttpFetcher::latest_header() {
    const auto id = next_request_id_++;
    const auto request = make_request(id, "eth_getBlockByNumber", {"latest", false});
    const auto content = co_await post(request.dump());

    const auto result = decode_response(content, id);
    if (result.is_null()) {
        throw JsonRpcError{kInvalidRequest, "latest block not available"};
    }
    co_return decode_header(result);
}

Task<std::string> JsonRpcHttpFetcher::post(const std::string& body) {
    boost::asio::ip::tcp::resolver resolver{executor_};
    boost::beast::tcp_stream stream{executor_};

    stream.expires_after(request_timeout_);
    const auto results = co_await resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port), use_awaitable);
    co_await stream.async_connect(results, use_awaitable);

    http::request<http::string_body> req{http::verb::post, endpoint_.target, 11};
    req.set(http::field::host, endpoint_.authority());
    req.set(http::field::user_agent, "blocksub");
    req.set(http::field::content_type, "application/json");
    req.keep_alive(false);
    req.body() = body;
    req.prepare_payload();
    co_await http::async_write(stream, req, use_awaitable);
    BLOCKSUB_TRACE << "JsonRpcHttpFetcher::post " << endpoint_ << " request: " << body;

    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseSize);
    co_await http::async_read(stream, buffer, parser, use_awaitable);
    auto res = parser.release();
    BLOCKSUB_TRACE << "JsonRpcHttpFetcher::post " << endpoint_ << " status: " << res.result_int();

    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::beast::errc::not_connected) {
        BLOCKSUB_TRACE << "JsonRpcHttpFetcher::post shutdown error: " << ec.message();
    }

    if (res.result() != http::status::ok) {
        throw std::runtime_error(absl::StrCat("HTTP status ", res.result_int(), " from ", endpoint_.to_string()));
    }
    co_return std::move(res.body());
}

}  // namespace blocksub::rpc
