// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_future.hpp>
#include <unistd.h>

#include <blocksub/cli/blocksub_options.hpp>
#include <blocksub/cli/head_printer.hpp>
#include <blocksub/core/block_sub.hpp>
#include <blocksub/infra/cli/common.hpp>
#include <blocksub/infra/cli/shutdown_signal.hpp>
#include <blocksub/infra/common/log.hpp>
#include <blocksub/infra/concurrency/awaitable_wait_for_one.hpp>
#include <blocksub/rpc/endpoint.hpp>
#include <blocksub/rpc/http_fetcher.hpp>
#include <blocksub/rpc/ws_subscriber.hpp>

using namespace blocksub;
using namespace blocksub::cmd;
using namespace blocksub::cmd::common;

CliSettings blocksub_parse_cli_settings(int argc, char* argv[]) {
    CLI::App cli{"BlockSub - chain head tracker for Ethereum JSON-RPC nodes"};

    CliSettings cli_settings;
    add_logging_options(cli, cli_settings.log_settings);
    add_blocksub_options(cli, cli_settings);

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& pe) {
        cli.exit(pe);
        throw;
    }

    return cli_settings;
}

Task<void> run_blocksub(CliSettings cli_settings) {
    using namespace concurrency::awaitable_wait_for_one;
    auto executor = co_await boost::asio::this_coro::executor;
    const auto& settings = cli_settings.settings;

    std::shared_ptr<HeaderFetcher> fetcher;
    if (!cli_settings.http_url.empty()) {
        fetcher = std::make_shared<rpc::JsonRpcHttpFetcher>(executor, rpc::Endpoint::parse(cli_settings.http_url), settings.request_timeout);
    }
    std::shared_ptr<HeaderSubscriber> subscriber;
    if (!cli_settings.ws_url.empty()) {
        subscriber = std::make_shared<rpc::JsonRpcWsSubscriber>(executor, rpc::Endpoint::parse(cli_settings.ws_url), settings.request_timeout);
    }

    BlockSub block_sub{executor, settings, fetcher, subscriber};
    co_await block_sub.start();

    std::vector<std::shared_ptr<Subscription>> subscriptions;
    for (size_t i{0}; i < cli_settings.subscribers; ++i) {
        subscriptions.push_back(block_sub.subscribe());
    }

    // until either:
    // - shutdown signal, then the consumers are cancelled
    // - BlockSub stopped on its own, closing all the subscriptions
    // - a consumer fails, then its exception is rethrown here
    co_await (ShutdownSignal::wait() || print_heads(std::move(subscriptions)));
    if (!block_sub.is_running()) {
        BLOCKSUB_ERROR << "BlockSub stopped on its own, exiting";
    }

    block_sub.stop();
    const auto stats = block_sub.stats();
    BLOCKSUB_INFO_M("BlockSub stats", {"latest", std::to_string(stats.latest_block_number),
                                       "polls", std::to_string(stats.polls),
                                       "poll_failures", std::to_string(stats.poll_failures),
                                       "pushed", std::to_string(stats.pushed_headers),
                                       "accepted", std::to_string(stats.accepted_headers),
                                       "reconnects", std::to_string(stats.reconnects),
                                       "forced_reconnects", std::to_string(stats.forced_reconnects)});
}

void blocksub_main(CliSettings cli_settings) {
    log::init(cli_settings.log_settings);
    log::set_thread_name("main");

    boost::asio::io_context ioc;
    auto run_future = boost::asio::co_spawn(ioc, run_blocksub(std::move(cli_settings)), boost::asio::use_future);

    const auto pid = ::getpid();
    const auto tid = std::this_thread::get_id();
    BLOCKSUB_INFO << "BlockSub is now running [pid=" << pid << ", main thread=" << tid << "]";

    ioc.run();
    run_future.get();

    BLOCKSUB_INFO << "BlockSub exiting [pid=" << pid << ", main thread=" << tid << "]";
}

int main(int argc, char* argv[]) {
    try {
        blocksub_main(blocksub_parse_cli_settings(argc, argv));
    } catch (const CLI::ParseError& pe) {
        return pe.get_exit_code();
    } catch (const std::exception& e) {
        BLOCKSUB_CRIT << "BlockSub exiting due to exception: " << e.what();
        return -2;
    } catch (...) {
        BLOCKSUB_CRIT << "BlockSub exiting due to unexpected exception";
        return -3;
    }
}
