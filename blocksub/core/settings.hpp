// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include <blocksub/types/header.hpp>

namespace blocksub {

struct Settings {
    //! Delay between two polls of the latest header
    std::chrono::milliseconds poll_interval{std::chrono::seconds{10}};
    //! Maximum silence of the push subscription before it's considered stale and reconnected
    std::chrono::milliseconds subscription_timeout{std::chrono::seconds{60}};
    //! Blocks the push source may lag behind polling before a reconnect is forced
    BlockNum max_push_lag{2};
    //! First retry delay after a failed reconnect, doubled at each failure
    std::chrono::milliseconds reconnect_backoff_min{std::chrono::seconds{1}};
    //! Upper bound of the retry delay
    std::chrono::milliseconds reconnect_backoff_max{std::chrono::seconds{30}};
    //! Timeout of a single JSON-RPC request
    std::chrono::milliseconds request_timeout{std::chrono::seconds{10}};
    //! Log every polled and pushed header at debug level
    bool debug_output{false};
};

}  // namespace blocksub
