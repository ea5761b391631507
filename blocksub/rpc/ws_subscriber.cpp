// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ws_subscriber.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <absl/strings/str_cat.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/system/system_error.hpp>

#include <blocksub/core/queued_header_stream.hpp>
#include <blocksub/infra/common/exception_ptr.hpp>
#include <blocksub/infra/common/log.hpp>

#include "json_rpc.hpp"

namespace blocksub::rpc {

using boost::asio::use_awaitable;
using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

static constexpr size_t kMaxMessageSize{16 * 1024 * 1024};

//! One websocket connection carrying a single newHeads subscription
class SubscriptionConnection : public std::enable_shared_from_this<SubscriptionConnection> {
  public:
    SubscriptionConnection(boost::asio::strand<boost::asio::any_io_executor> strand, Endpoint endpoint)
        : strand_(std::move(strand)), endpoint_(std::move(endpoint)), ws_(strand_) {}

    ~SubscriptionConnection() {
        BLOCKSUB_TRACE << "SubscriptionConnection::~SubscriptionConnection " << endpoint_;
    }

    Task<void> connect(std::chrono::milliseconds timeout) {
        boost::asio::ip::tcp::resolver resolver{strand_};
        auto& tcp_stream = boost::beast::get_lowest_layer(ws_);
        tcp_stream.expires_after(timeout);
        const auto results = co_await resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port), use_awaitable);
        co_await tcp_stream.async_connect(results, use_awaitable);

        // From now on the websocket timeouts apply
        tcp_stream.expires_never();
        ws_.set_option(boost::beast::websocket::stream_base::timeout{
            .handshake_timeout = timeout,
            .idle_timeout = boost::beast::websocket::stream_base::none(),
            .keep_alive_pings = false,
        });
        ws_.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::request_type& req) {
            req.set(boost::beast::http::field::user_agent, "blocksub");
        }));
        ws_.read_message_max(kMaxMessageSize);
        co_await ws_.async_handshake(endpoint_.authority(), endpoint_.target, use_awaitable);
        BLOCKSUB_TRACE << "SubscriptionConnection::connect handshake done with " << endpoint_;
    }

    //! Sends eth_subscribe and waits for the subscription id, at most timeout for both
    Task<void> subscribe(uint64_t request_id, std::chrono::milliseconds timeout) {
        const auto request = make_request(request_id, "eth_subscribe", {"newHeads"}).dump();
        // websocket idle_timeout is none, the confirmation is bounded by the tcp stream deadline
        auto& tcp_stream = boost::beast::get_lowest_layer(ws_);
        tcp_stream.expires_after(timeout);
        co_await ws_.async_write(boost::asio::buffer(request), use_awaitable);
        auto response = co_await read_message();
        tcp_stream.expires_never();

        const auto result = decode_response(response, request_id);
        if (!result.is_string()) {
            throw JsonRpcError{kInvalidRequest, "eth_subscribe did not return a subscription id"};
        }
        subscription_id_ = result.get<std::string>();
        BLOCKSUB_DEBUG_M("Subscribed to newHeads", {"endpoint", endpoint_.to_string(), "id", subscription_id_});
    }

    //! Feeds stream until the connection ends or the stream is closed
    static Task<void> read_loop(std::shared_ptr<SubscriptionConnection> self, std::shared_ptr<QueuedHeaderStream> stream) {
        std::exception_ptr error;
        try {
            while (true) {
                auto header = self->decode_notification(co_await self->read_message());
                if (header) {
                    co_await stream->push(std::move(header));
                }
            }
        } catch (...) {
            error = std::current_exception();
        }

        if (stream->is_ended()) {
            BLOCKSUB_TRACE << "SubscriptionConnection::read_loop stream closed: " << describe_exception(error);
        } else {
            BLOCKSUB_TRACE << "SubscriptionConnection::read_loop failed: " << describe_exception(error);
            stream->fail(error);
        }
        self->close_socket();
    }

    //! Thread-safe, tears down the connection making a pending read fail
    void close() {
        boost::asio::post(strand_, [self = shared_from_this()]() { self->close_socket(); });
    }

  private:
    Task<std::string> read_message() {
        boost::beast::flat_buffer buffer;
        co_await ws_.async_read(buffer, use_awaitable);
        co_return boost::beast::buffers_to_string(buffer.data());
    }

    //! Header of a newHeads notification, nullptr for any other message
    HeaderPtr decode_notification(const std::string& content) const {
        const auto message = nlohmann::json::parse(content, nullptr, /* allow_exceptions = */ false);
        if (message.is_discarded() || !message.is_object()) {
            throw JsonRpcError{kParseError, "invalid JSON notification"};
        }
        if (message.value("method", "") != "eth_subscription") {
            BLOCKSUB_DEBUG << "SubscriptionConnection: unexpected message ignored";
            return nullptr;
        }
        const auto params = message.find("params");
        if (params == message.end() || !params->is_object() || params->value("subscription", "") != subscription_id_) {
            BLOCKSUB_DEBUG << "SubscriptionConnection: notification for unknown subscription ignored";
            return nullptr;
        }
        const auto result = params->find("result");
        if (result == params->end()) {
            throw JsonRpcError{kInvalidRequest, "notification without result"};
        }
        return decode_header(*result);
    }

    void close_socket() {
        auto& socket = boost::beast::get_lowest_layer(ws_).socket();
        if (!socket.is_open()) return;
        boost::system::error_code ec;
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);
        if (ec) {
            BLOCKSUB_TRACE << "SubscriptionConnection::close_socket error: " << ec.message();
        }
    }

    boost::asio::strand<boost::asio::any_io_executor> strand_;
    Endpoint endpoint_;
    WebSocket ws_;
    std::string subscription_id_;
};

JsonRpcWsSubscriber::JsonRpcWsSubscriber(boost::asio::any_io_executor executor,
                                         Endpoint endpoint,
                                         std::chrono::milliseconds request_timeout)
    : executor_(std::move(executor)),
      endpoint_(std::move(endpoint)),
      request_timeout_(request_timeout) {
    if (endpoint_.scheme != "ws") {
        throw std::invalid_argument(absl::StrCat("JsonRpcWsSubscriber: ws endpoint expected, got ", endpoint_.to_string()));
    }
}

static Task<void> establish(std::shared_ptr<SubscriptionConnection> connection,
                            std::chrono::milliseconds timeout,
                            uint64_t request_id) {
    co_await connection->connect(timeout);
    co_await connection->subscribe(request_id, timeout);
}

Task<std::shared_ptr<HeaderStream>> JsonRpcWsSubscriber::subscribe_new_heads() {
    auto strand = boost::asio::make_strand(executor_);
    auto connection = std::make_shared<SubscriptionConnection>(strand, endpoint_);

    // All socket operations run on the connection strand
    co_await boost::asio::co_spawn(strand, establish(connection, request_timeout_, next_request_id_++), use_awaitable);

    auto stream = std::make_shared<QueuedHeaderStream>(
        executor_,
        [weak_connection = std::weak_ptr<SubscriptionConnection>{connection}]() {
            if (auto connection = weak_connection.lock()) {
                connection->close();
            }
        });
    boost::asio::co_spawn(strand, SubscriptionConnection::read_loop(connection, stream), boost::asio::detached);

    co_return stream;
}

}  // namespace blocksub::rpc
