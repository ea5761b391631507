// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_sub.hpp"

#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <blocksub/common/util.hpp>
#include <blocksub/infra/common/assert.hpp>
#include <blocksub/infra/common/exception_ptr.hpp>
#include <blocksub/infra/common/log.hpp>
#include <blocksub/infra/concurrency/atomic_value.hpp>
#include <blocksub/infra/concurrency/awaitable_wait_for_one.hpp>
#include <blocksub/infra/concurrency/broadcast_event.hpp>
#include <blocksub/infra/concurrency/channel.hpp>
#include <blocksub/infra/concurrency/sleep.hpp>
#include <blocksub/infra/concurrency/spawn.hpp>
#include <blocksub/infra/concurrency/task_group.hpp>

#include "reconnect_guard.hpp"
#include "subscriber_registry.hpp"

namespace blocksub {

using namespace boost::asio;

//! Upper bound of concurrently tracked background tasks (loops, reconnects, unsubscribe watchers)
static constexpr size_t kMaxTasks{1 << 16};

[[noreturn]] static void throw_operation_canceled() {
    throw boost::system::system_error(make_error_code(boost::system::errc::operation_canceled));
}

class BlockSubImpl : public std::enable_shared_from_this<BlockSubImpl> {
  public:
    BlockSubImpl(const any_io_executor& executor,
                 Settings settings,
                 std::shared_ptr<HeaderFetcher> fetcher,
                 std::shared_ptr<HeaderSubscriber> subscriber);

    BlockSubImpl(const BlockSubImpl&) = delete;
    BlockSubImpl& operator=(const BlockSubImpl&) = delete;

    Task<void> start();
    void stop();
    bool is_running() const { return state_ == State::kRunning; }
    std::shared_ptr<Subscription> subscribe(std::shared_ptr<concurrency::BroadcastEvent> unsubscribe_signal);
    std::optional<HeadState> current_head() const { return head_snapshot_.get(); }
    Stats stats() const;

  private:
    enum class State {
        kIdle,
        kStarting,
        kRunning,
        kStopped,
    };

    static Task<void> start_on_strand(std::shared_ptr<BlockSubImpl> self);
    static Task<void> run(std::shared_ptr<BlockSubImpl> self);
    static Task<void> reconcile_loop(std::shared_ptr<BlockSubImpl> self);
    static Task<void> poll_loop(std::shared_ptr<BlockSubImpl> self, HeaderPtr first_header);
    static Task<void> receive_loop(std::shared_ptr<BlockSubImpl> self, std::shared_ptr<HeaderStream> stream);
    static Task<void> forced_reconnect(std::shared_ptr<BlockSubImpl> self);
    static Task<void> unsubscribe_on_signal(
        std::shared_ptr<BlockSubImpl> self,
        std::shared_ptr<Subscription> subscription,
        std::shared_ptr<concurrency::BroadcastEvent> unsubscribe_signal);

    //! Replaces the push stream, run by the ReconnectGuard leader only
    Task<void> connect_push_source();
    //! Failures are logged and yield nullptr
    Task<HeaderPtr> poll_once();
    void check_push_lag(BlockNum polled_number);
    void on_accepted(const HeaderPtr& header);
    void close_stream();
    bool is_stopped() const { return state_ == State::kStopped; }

    strand<any_io_executor> strand_;
    Settings settings_;
    std::shared_ptr<HeaderFetcher> fetcher_;
    std::shared_ptr<HeaderSubscriber> subscriber_;

    concurrency::Channel<HeaderPtr> merge_channel_;
    Reconciler reconciler_;
    concurrency::AtomicValue<std::optional<HeadState>> head_snapshot_;
    std::shared_ptr<SubscriberRegistry> registry_;
    ReconnectGuard reconnect_guard_;
    concurrency::TaskGroup tasks_;
    //! Set by stop(), ends run() whenever it starts
    concurrency::BroadcastEvent stop_requested_;
    std::atomic<State> state_{State::kIdle};

    std::mutex stream_mutex_;
    std::shared_ptr<HeaderStream> stream_;
    concurrency::AtomicValue<std::optional<BlockNum>> latest_pushed_number_;

    std::atomic<BlockNum> latest_block_number_{0};
    std::atomic_uint64_t polls_{0};
    std::atomic_uint64_t poll_failures_{0};
    std::atomic_uint64_t pushed_headers_{0};
    std::atomic_uint64_t accepted_headers_{0};
    std::atomic_uint64_t forced_reconnects_{0};
};

BlockSubImpl::BlockSubImpl(const any_io_executor& executor,
                           Settings settings,
                           std::shared_ptr<HeaderFetcher> fetcher,
                           std::shared_ptr<HeaderSubscriber> subscriber)
    : strand_(make_strand(executor)),
      settings_(std::move(settings)),
      fetcher_(std::move(fetcher)),
      subscriber_(std::move(subscriber)),
      merge_channel_(strand_),
      registry_(std::make_shared<SubscriberRegistry>(executor)),
      reconnect_guard_(
          "push",
          [this]() { return connect_push_source(); },
          ReconnectGuard::Backoff{settings_.reconnect_backoff_min, settings_.reconnect_backoff_max}),
      tasks_(strand_, kMaxTasks) {
    if (!fetcher_ && !subscriber_) {
        throw std::invalid_argument("BlockSub requires a header fetcher or a header subscriber");
    }
}

Task<void> BlockSubImpl::start() {
    co_await concurrency::spawn_task(strand_, start_on_strand(shared_from_this()));
}

Task<void> BlockSubImpl::start_on_strand(std::shared_ptr<BlockSubImpl> self) {
    auto expected = State::kIdle;
    if (!self->state_.compare_exchange_strong(expected, State::kStarting)) {
        throw std::logic_error("BlockSub::start: already started or stopped");
    }

    co_spawn(self->strand_, run(self), detached);

    std::exception_ptr failure;
    try {
        self->tasks_.spawn(self->strand_, reconcile_loop(self), "reconcile_loop");
        if (self->subscriber_) {
            co_await self->reconnect_guard_.attempt(/*retry_forever=*/false);
        }
        if (self->fetcher_) {
            if (self->is_stopped()) throw_operation_canceled();
            ++self->polls_;
            auto first_header = co_await self->fetcher_->latest_header();
            self->tasks_.spawn(self->strand_, poll_loop(self, std::move(first_header)), "poll_loop");
        }
    } catch (const concurrency::TaskGroup::SpawnAfterCloseError&) {
        // run() has already closed the task group on stop()
        failure = std::make_exception_ptr(boost::system::system_error(make_error_code(boost::system::errc::operation_canceled)));
    } catch (...) {
        failure = std::current_exception();
    }
    if (failure) {
        if (!is_operation_cancelled_error(failure)) {
            BLOCKSUB_ERROR_M("BlockSub start failed", {"error", describe_exception(failure)});
        }
        self->stop();
        std::rethrow_exception(failure);
    }

    expected = State::kStarting;
    if (!self->state_.compare_exchange_strong(expected, State::kRunning)) {
        // stopped by stop() while starting
        throw_operation_canceled();
    }
    BLOCKSUB_INFO_M("BlockSub started", {"poll", self->fetcher_ ? "on" : "off", "push", self->subscriber_ ? "on" : "off"});
}

Task<void> BlockSubImpl::run(std::shared_ptr<BlockSubImpl> self) {
    using namespace concurrency::awaitable_wait_for_one;

    std::exception_ptr failure;
    try {
        // tasks_.wait() only returns on failure, the stop request cancels it and the tasks
        co_await (self->tasks_.wait() || self->stop_requested_.wait());
    } catch (...) {
        failure = std::current_exception();
    }
    if (failure && !is_operation_cancelled_error(failure)) {
        BLOCKSUB_CRIT_M("BlockSub background task failed, stopping", {"error", describe_exception(failure)});
        self->stop();
    }
    BLOCKSUB_DEBUG << "BlockSub::run completed";
}

void BlockSubImpl::stop() {
    const auto previous = state_.exchange(State::kStopped);
    if (previous == State::kStopped) {
        return;
    }
    BLOCKSUB_INFO << "BlockSub stopping";

    registry_->close_all();
    close_stream();
    stop_requested_.notify();
}

std::shared_ptr<Subscription> BlockSubImpl::subscribe(std::shared_ptr<concurrency::BroadcastEvent> unsubscribe_signal) {
    auto subscription = registry_->add();
    if (!unsubscribe_signal || subscription->is_stopped()) {
        return subscription;
    }
    try {
        tasks_.spawn(strand_, unsubscribe_on_signal(shared_from_this(), subscription, std::move(unsubscribe_signal)), "unsubscribe_on_signal");
    } catch (const concurrency::TaskGroup::SpawnAfterCloseError&) {
        subscription->unsubscribe();
    }
    return subscription;
}

Task<void> BlockSubImpl::unsubscribe_on_signal(
    std::shared_ptr<BlockSubImpl> /*self*/,
    std::shared_ptr<Subscription> subscription,
    std::shared_ptr<concurrency::BroadcastEvent> unsubscribe_signal) {
    using namespace concurrency::awaitable_wait_for_one;

    std::exception_ptr error;
    try {
        co_await (unsubscribe_signal->wait() || subscription->done());
    } catch (...) {
        error = std::current_exception();
    }
    subscription->unsubscribe();
    if (error && !is_operation_cancelled_error(error)) {
        std::rethrow_exception(error);
    }
}

Task<void> BlockSubImpl::reconcile_loop(std::shared_ptr<BlockSubImpl> self) {
    while (true) {
        auto header = co_await self->merge_channel_.receive();
        if (!self->reconciler_.reconcile(header)) {
            continue;
        }
        self->on_accepted(header);
    }
}

void BlockSubImpl::on_accepted(const HeaderPtr& header) {
    BLOCKSUB_ASSERT(reconciler_.head() && reconciler_.head()->header == header);
    head_snapshot_.set(reconciler_.head());
    latest_block_number_ = header->number;
    ++accepted_headers_;

    const auto delivered = registry_->fan_out(header);
    BLOCKSUB_DEBUG_M("Latest block number", {"number", std::to_string(header->number),
                                             "hash", to_hex(header->hash),
                                             "delivered", std::to_string(delivered)});
}

Task<void> BlockSubImpl::poll_loop(std::shared_ptr<BlockSubImpl> self, HeaderPtr first_header) {
    auto header = std::move(first_header);
    while (true) {
        if (header) {
            co_await self->merge_channel_.send(header);
            self->check_push_lag(header->number);
        }
        co_await sleep(self->settings_.poll_interval);
        header = co_await self->poll_once();
    }
}

Task<HeaderPtr> BlockSubImpl::poll_once() {
    ++polls_;
    std::exception_ptr error;
    try {
        auto header = co_await fetcher_->latest_header();
        if (settings_.debug_output && header) {
            BLOCKSUB_DEBUG_M("Polled header", {"number", std::to_string(header->number), "hash", to_hex(header->hash)});
        }
        co_return header;
    } catch (...) {
        error = std::current_exception();
    }
    if (is_operation_cancelled_error(error)) {
        std::rethrow_exception(error);
    }
    ++poll_failures_;
    BLOCKSUB_ERROR_M("Polling latest header failed", {"error", describe_exception(error)});
    co_return nullptr;
}

void BlockSubImpl::check_push_lag(BlockNum polled_number) {
    if (!subscriber_) {
        return;
    }
    const auto pushed_number = latest_pushed_number_.get();
    if (!pushed_number || polled_number <= *pushed_number || polled_number - *pushed_number <= settings_.max_push_lag) {
        return;
    }
    if (reconnect_guard_.is_connecting()) {
        return;
    }

    ++forced_reconnects_;
    BLOCKSUB_WARN_M("Push source lagging, forcing reconnect", {"pushed", std::to_string(*pushed_number),
                                                               "polled", std::to_string(polled_number)});
    try {
        tasks_.spawn(strand_, forced_reconnect(shared_from_this()), "forced_reconnect");
    } catch (const concurrency::TaskGroup::SpawnAfterCloseError&) {
        BLOCKSUB_DEBUG << "BlockSub::check_push_lag: stopping, reconnect skipped";
    }
}

Task<void> BlockSubImpl::forced_reconnect(std::shared_ptr<BlockSubImpl> self) {
    co_await self->reconnect_guard_.attempt(/*retry_forever=*/true);
}

Task<void> BlockSubImpl::connect_push_source() {
    close_stream();
    if (is_stopped()) throw_operation_canceled();

    auto stream = co_await subscriber_->subscribe_new_heads();
    {
        std::scoped_lock lock{stream_mutex_};
        stream_ = stream;
    }
    // stop() may have run while subscribing
    if (is_stopped()) {
        stream->close();
        throw_operation_canceled();
    }

    try {
        tasks_.spawn(strand_, receive_loop(shared_from_this(), stream), "receive_loop");
    } catch (const concurrency::TaskGroup::SpawnAfterCloseError&) {
        stream->close();
        throw_operation_canceled();
    }
}

Task<void> BlockSubImpl::receive_loop(std::shared_ptr<BlockSubImpl> self, std::shared_ptr<HeaderStream> stream) {
    using namespace concurrency::awaitable_wait_for_one;
    const auto timeout = self->settings_.subscription_timeout;

    while (true) {
        std::variant<HeaderPtr, std::monostate> result;
        std::exception_ptr error;
        try {
            result = co_await (stream->next() || sleep(timeout));
        } catch (...) {
            error = std::current_exception();
        }

        if (is_operation_cancelled_error(error)) {
            std::rethrow_exception(error);
        }
        if (error) {
            BLOCKSUB_ERROR_M("Push subscription failed, reconnecting", {"error", describe_exception(error)});
            break;
        }
        if (result.index() == 1) {
            BLOCKSUB_ERROR_M("Push subscription timed out, reconnecting", {"timeout", std::to_string(timeout.count()) + "ms"});
            break;
        }

        auto header = std::get<0>(std::move(result));
        if (!header) {
            BLOCKSUB_DEBUG << "BlockSub::receive_loop: push stream closed";
            co_return;
        }
        ++self->pushed_headers_;
        self->latest_pushed_number_.set(header->number);
        if (self->settings_.debug_output) {
            BLOCKSUB_DEBUG_M("Pushed header", {"number", std::to_string(header->number), "hash", to_hex(header->hash)});
        }
        co_await self->merge_channel_.send(std::move(header));
    }

    stream->close();
    co_await self->reconnect_guard_.attempt(/*retry_forever=*/true);
}

void BlockSubImpl::close_stream() {
    std::shared_ptr<HeaderStream> stream;
    {
        std::scoped_lock lock{stream_mutex_};
        stream = std::move(stream_);
    }
    if (stream) {
        stream->close();
    }
}

Stats BlockSubImpl::stats() const {
    return Stats{
        .latest_block_number = latest_block_number_,
        .polls = polls_,
        .poll_failures = poll_failures_,
        .pushed_headers = pushed_headers_,
        .accepted_headers = accepted_headers_,
        .reconnect_attempts = reconnect_guard_.attempts(),
        .reconnects = reconnect_guard_.connections(),
        .forced_reconnects = forced_reconnects_,
    };
}

BlockSub::BlockSub(const any_io_executor& executor,
                   Settings settings,
                   std::shared_ptr<HeaderFetcher> fetcher,
                   std::shared_ptr<HeaderSubscriber> subscriber)
    : p_impl_(std::make_shared<BlockSubImpl>(executor, std::move(settings), std::move(fetcher), std::move(subscriber))) {}

BlockSub::~BlockSub() {
    p_impl_->stop();
}

Task<void> BlockSub::start() {
    return p_impl_->start();
}

void BlockSub::stop() {
    p_impl_->stop();
}

bool BlockSub::is_running() const {
    return p_impl_->is_running();
}

std::shared_ptr<Subscription> BlockSub::subscribe(std::shared_ptr<concurrency::BroadcastEvent> unsubscribe_signal) {
    return p_impl_->subscribe(std::move(unsubscribe_signal));
}

std::optional<HeadState> BlockSub::current_head() const {
    return p_impl_->current_head();
}

Stats BlockSub::stats() const {
    return p_impl_->stats();
}

}  // namespace blocksub
