// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include <blocksub/infra/concurrency/task.hpp>

#include <blocksub/core/subscription.hpp>

namespace blocksub::cmd {

//! Logs the heads received by each subscription until all of them are closed.
//! A failing consumer cancels the others and its exception is rethrown.
Task<void> print_heads(std::vector<std::shared_ptr<Subscription>> subscriptions);

}  // namespace blocksub::cmd
