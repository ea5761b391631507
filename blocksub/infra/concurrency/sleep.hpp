// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include <blocksub/infra/concurrency/task.hpp>

namespace blocksub {

//! Suspends the calling coroutine, throws operation_canceled if cancelled meanwhile
Task<void> sleep(std::chrono::milliseconds duration);

}  // namespace blocksub
