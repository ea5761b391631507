// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "http_fetcher.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <blocksub/infra/test_util/log.hpp>
#include <blocksub/infra/test_util/task_runner.hpp>

#include "json_rpc.hpp"

namespace blocksub::rpc {

using namespace std::chrono_literals;
namespace http = boost::beast::http;
using boost::asio::ip::tcp;

//! Serves one canned response per accepted connection, echoing the request id
class HttpServerForTest {
  public:
    explicit HttpServerForTest(boost::asio::any_io_executor executor)
        : acceptor_(executor, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}) {
        boost::asio::co_spawn(executor, serve(), boost::asio::detached);
    }

    Endpoint endpoint() const {
        return Endpoint{.scheme = "http", .host = "127.0.0.1", .port = acceptor_.local_endpoint().port(), .target = "/"};
    }

    http::status status{http::status::ok};
    //! Response result, the response carries this error object instead if set
    nlohmann::json result;
    nlohmann::json error;
    nlohmann::json last_request;

  private:
    Task<void> serve() {
        while (true) {
            auto socket = co_await acceptor_.async_accept(boost::asio::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(socket, buffer, req, boost::asio::use_awaitable);
            last_request = nlohmann::json::parse(req.body());

            nlohmann::json response{{"jsonrpc", "2.0"}, {"id", last_request["id"]}};
            if (error.is_null()) {
                response["result"] = result;
            } else {
                response["error"] = error;
            }
            http::response<http::string_body> res{status, req.version()};
            res.set(http::field::content_type, "application/json");
            res.body() = response.dump();
            res.prepare_payload();
            co_await http::async_write(socket, res, boost::asio::use_awaitable);
        }
    }

    tcp::acceptor acceptor_;
};

static const nlohmann::json kLatestBlock = R"({
    "number": "0x10",
    "hash": "0x0000000000000000000000000000000000000000000000000000000000000abc",
    "parentHash": "0x0000000000000000000000000000000000000000000000000000000000000abb",
    "timestamp": "0x64",
    "transactions": []
})"_json;

TEST_CASE("JsonRpcHttpFetcher", "[rpc][http_fetcher]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    HttpServerForTest server{runner.executor()};
    JsonRpcHttpFetcher fetcher{runner.executor(), server.endpoint(), 5s};

    SECTION("latest header") {
        server.result = kLatestBlock;
        const auto header = runner.run(fetcher.latest_header());
        REQUIRE(header);
        CHECK(header->number == 16);
        CHECK(header->timestamp == 100);
        CHECK(server.last_request["method"] == "eth_getBlockByNumber");
        CHECK(server.last_request["params"] == R"(["latest", false])"_json);

        // request ids increase
        const auto first_id = server.last_request["id"].get<uint64_t>();
        runner.run(fetcher.latest_header());
        CHECK(server.last_request["id"].get<uint64_t>() == first_id + 1);
    }

    SECTION("null result") {
        server.result = nullptr;
        CHECK_THROWS_AS(runner.run(fetcher.latest_header()), JsonRpcError);
    }

    SECTION("error response") {
        server.error = R"({"code": -32000, "message": "header not found"})"_json;
        CHECK_THROWS_AS(runner.run(fetcher.latest_header()), JsonRpcError);
    }

    SECTION("HTTP status other than 200") {
        server.result = kLatestBlock;
        server.status = http::status::service_unavailable;
        CHECK_THROWS_AS(runner.run(fetcher.latest_header()), std::runtime_error);
    }
}

TEST_CASE("JsonRpcHttpFetcher connection refused", "[rpc][http_fetcher]") {
    test_util::TaskRunner runner;
    uint16_t unused_port{0};
    {
        tcp::acceptor acceptor{runner.ioc(), tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
        unused_port = acceptor.local_endpoint().port();
    }
    JsonRpcHttpFetcher fetcher{runner.executor(), Endpoint{.scheme = "http", .host = "127.0.0.1", .port = unused_port}, 1s};
    CHECK_THROWS_AS(runner.run(fetcher.latest_header()), boost::system::system_error);
}

TEST_CASE("JsonRpcHttpFetcher requires http endpoint", "[rpc][http_fetcher]") {
    test_util::TaskRunner runner;
    CHECK_THROWS_AS(JsonRpcHttpFetcher(runner.executor(), Endpoint::parse("ws://localhost:8546"), 1s), std::invalid_argument);
}

}  // namespace blocksub::rpc
