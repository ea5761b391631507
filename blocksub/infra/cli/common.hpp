// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

#include <CLI/CLI.hpp>

#include <blocksub/infra/common/log.hpp>

namespace blocksub::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up a duration option accepting a unit suffix (ms, s, m), milliseconds by default
CLI::Option* add_option_duration(CLI::App& cli, const std::string& name, std::chrono::milliseconds& duration, const std::string& description);

}  // namespace blocksub::cmd::common
