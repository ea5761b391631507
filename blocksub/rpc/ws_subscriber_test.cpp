// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ws_subscriber.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <blocksub/common/util.hpp>
#include <blocksub/infra/test_util/log.hpp>
#include <blocksub/infra/test_util/task_runner.hpp>

#include "json_rpc.hpp"

namespace blocksub::rpc {

using namespace std::chrono_literals;
using boost::asio::ip::tcp;
using boost::asio::use_awaitable;

static constexpr auto kSubscriptionId{"0x9ce59a13059e417087c02d3236a0b1cc"};

//! Websocket JSON-RPC server accepting eth_subscribe, notifications are sent on demand
class WsServerForTest {
  public:
    using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    explicit WsServerForTest(boost::asio::any_io_executor executor)
        : acceptor_(executor, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}) {
        boost::asio::co_spawn(executor, serve(), boost::asio::detached);
    }

    Endpoint endpoint() const {
        return Endpoint{.scheme = "ws", .host = "127.0.0.1", .port = acceptor_.local_endpoint().port(), .target = "/"};
    }

    Task<void> notify(const nlohmann::json& header, std::string subscription = kSubscriptionId) {
        const nlohmann::json notification{
            {"jsonrpc", "2.0"},
            {"method", "eth_subscription"},
            {"params", {{"subscription", subscription}, {"result", header}}},
        };
        co_await ws_->async_write(boost::asio::buffer(notification.dump()), use_awaitable);
    }

    Task<void> send_raw(std::string content) {
        co_await ws_->async_write(boost::asio::buffer(content), use_awaitable);
    }

    //! Abrupt connection loss
    void drop() {
        boost::system::error_code ec;
        boost::beast::get_lowest_layer(*ws_).socket().close(ec);
    }

    bool reject_subscribe{false};
    bool silent_on_subscribe{false};
    int subscriptions{0};
    nlohmann::json last_request;

  private:
    Task<void> serve() {
        while (true) {
            auto socket = co_await acceptor_.async_accept(use_awaitable);
            ws_ = std::make_shared<WebSocket>(std::move(socket));
            co_await ws_->async_accept(use_awaitable);

            boost::beast::flat_buffer buffer;
            co_await ws_->async_read(buffer, use_awaitable);
            last_request = nlohmann::json::parse(boost::beast::buffers_to_string(buffer.data()));
            if (silent_on_subscribe) {
                // leaves the request unanswered, the client gives up and closes
                boost::beast::flat_buffer ignored;
                boost::system::error_code ec;
                co_await ws_->async_read(ignored, boost::asio::redirect_error(use_awaitable, ec));
                continue;
            }

            nlohmann::json response{{"jsonrpc", "2.0"}, {"id", last_request["id"]}};
            if (reject_subscribe) {
                response["error"] = {{"code", -32601}, {"message", "notifications not supported"}};
            } else {
                response["result"] = kSubscriptionId;
            }
            co_await ws_->async_write(boost::asio::buffer(response.dump()), use_awaitable);
            ++subscriptions;
        }
    }

    tcp::acceptor acceptor_;
    std::shared_ptr<WebSocket> ws_;
};

static nlohmann::json header_json(uint64_t number) {
    return {
        {"number", to_quantity(number)},
        {"hash", to_hex(evmc::bytes32{number})},
        {"parentHash", to_hex(evmc::bytes32{number - 1})},
        {"timestamp", "0x6553f100"},
    };
}

TEST_CASE("JsonRpcWsSubscriber", "[rpc][ws_subscriber]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    WsServerForTest server{runner.executor()};
    JsonRpcWsSubscriber subscriber{runner.executor(), server.endpoint(), 5s};

    SECTION("subscription request") {
        auto stream = runner.run(subscriber.subscribe_new_heads());
        REQUIRE(stream);
        CHECK(server.last_request["method"] == "eth_subscribe");
        CHECK(server.last_request["params"] == R"(["newHeads"])"_json);
        stream->close();
    }

    SECTION("notifications become headers") {
        auto stream = runner.run(subscriber.subscribe_new_heads());
        runner.run(server.notify(header_json(100)));
        runner.run(server.notify(header_json(101)));

        const auto first = runner.run(stream->next());
        REQUIRE(first);
        CHECK(first->number == 100);
        CHECK(first->hash == evmc::bytes32{100});
        const auto second = runner.run(stream->next());
        REQUIRE(second);
        CHECK(second->number == 101);
        stream->close();
    }

    SECTION("unrelated messages are ignored") {
        auto stream = runner.run(subscriber.subscribe_new_heads());
        runner.run(server.notify(header_json(7), "0x1"));
        runner.run(server.send_raw(R"({"jsonrpc":"2.0","method":"net_peerCount"})"));
        runner.run(server.notify(header_json(8)));

        const auto header = runner.run(stream->next());
        REQUIRE(header);
        CHECK(header->number == 8);
        stream->close();
    }

    SECTION("malformed notification ends the stream abnormally") {
        auto stream = runner.run(subscriber.subscribe_new_heads());
        runner.run(server.send_raw("{not json"));
        CHECK_THROWS_AS(runner.run(stream->next()), JsonRpcError);
    }

    SECTION("connection loss ends the stream abnormally") {
        auto stream = runner.run(subscriber.subscribe_new_heads());
        server.drop();
        CHECK_THROWS_AS(runner.run(stream->next()), boost::system::system_error);
    }

    SECTION("close ends the stream cleanly") {
        auto stream = runner.run(subscriber.subscribe_new_heads());
        stream->close();
        CHECK(runner.run(stream->next()) == nullptr);
    }

    SECTION("each subscription uses a new connection") {
        auto first = runner.run(subscriber.subscribe_new_heads());
        first->close();
        auto second = runner.run(subscriber.subscribe_new_heads());
        CHECK(runner.poll_until([&] { return server.subscriptions == 2; }));
        second->close();
    }

    SECTION("rejected subscription") {
        server.reject_subscribe = true;
        CHECK_THROWS_AS(runner.run(subscriber.subscribe_new_heads()), JsonRpcError);
    }
}

TEST_CASE("JsonRpcWsSubscriber unanswered subscription times out", "[rpc][ws_subscriber]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    WsServerForTest server{runner.executor()};
    server.silent_on_subscribe = true;
    JsonRpcWsSubscriber subscriber{runner.executor(), server.endpoint(), 100ms};

    const auto started = std::chrono::steady_clock::now();
    CHECK_THROWS_AS(runner.run(subscriber.subscribe_new_heads()), boost::system::system_error);
    CHECK(std::chrono::steady_clock::now() - started < 5s);
    CHECK(server.last_request["method"] == "eth_subscribe");
}

TEST_CASE("JsonRpcWsSubscriber requires ws endpoint", "[rpc][ws_subscriber]") {
    test_util::TaskRunner runner;
    CHECK_THROWS_AS(JsonRpcWsSubscriber(runner.executor(), Endpoint::parse("http://localhost:8545"), 1s), std::invalid_argument);
}

}  // namespace blocksub::rpc
