// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "blocksub_options.hpp"

#include <stdexcept>

#include <blocksub/infra/cli/common.hpp>
#include <blocksub/rpc/endpoint.hpp>

namespace blocksub::cmd {

//! CLI11 validator for a JSON-RPC endpoint URL with the expected scheme
struct EndpointUrlValidator : public CLI::Validator {
    explicit EndpointUrlValidator(const std::string& scheme) {
        name_ = "URL";
        func_ = [scheme](const std::string& value) -> std::string {
            try {
                const auto endpoint = rpc::Endpoint::parse(value);
                if (endpoint.scheme != scheme) {
                    return "URL scheme must be " + scheme + ": " + value;
                }
            } catch (const std::invalid_argument& ex) {
                return ex.what();
            }
            return {};
        };
    }
};

void add_blocksub_options(CLI::App& cli, CliSettings& cli_settings) {
    auto& settings = cli_settings.settings;

    auto http_option = cli.add_option("--http.url", cli_settings.http_url, "JSON-RPC HTTP endpoint polled for the latest header, e.g. http://localhost:8545")
                           ->check(EndpointUrlValidator{"http"});
    auto ws_option = cli.add_option("--ws.url", cli_settings.ws_url, "JSON-RPC websocket endpoint subscribed to newHeads, e.g. ws://localhost:8546")
                         ->check(EndpointUrlValidator{"ws"});
    // at least one source
    auto sources = cli.add_option_group("Sources");
    sources->add_options(http_option, ws_option);
    sources->require_option(1, 2);

    common::add_option_duration(cli, "--poll.interval", settings.poll_interval, "Delay between two polls of the latest header");
    common::add_option_duration(cli, "--sub.timeout", settings.subscription_timeout, "Silence after which the push subscription is reconnected");
    common::add_option_duration(cli, "--request.timeout", settings.request_timeout, "Timeout of a single JSON-RPC request");
    cli.add_option("--sub.maxlag", settings.max_push_lag, "Blocks the push subscription may lag behind polling before being reconnected")
        ->capture_default_str();
    cli.add_flag("--debug", settings.debug_output, "Log every polled and pushed header");
    cli.add_option("--subscribers", cli_settings.subscribers, "Number of subscriptions printing new heads")
        ->check(CLI::Range(1, 1024))
        ->capture_default_str();
}

}  // namespace blocksub::cmd
