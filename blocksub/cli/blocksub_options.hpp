// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include <blocksub/core/settings.hpp>
#include <blocksub/infra/common/log.hpp>

namespace blocksub::cmd {

//! Everything the blocksub executable needs, populated by cli.parse()
struct CliSettings {
    log::Settings log_settings;
    Settings settings;
    std::string http_url;
    std::string ws_url;
    //! Number of independent subscriptions printing the heads
    size_t subscribers{1};
};

void add_blocksub_options(CLI::App& cli, CliSettings& cli_settings);

}  // namespace blocksub::cmd
