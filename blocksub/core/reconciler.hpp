// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>

#include <blocksub/types/header.hpp>

namespace blocksub {

//! The current chain head as decided by the Reconciler
struct HeadState {
    HeaderPtr header;
    BlockNum number{0};
    evmc::bytes32 hash{};
};

/**
 * Merges headers coming from independent sources into a single monotonic head.
 *
 * A header is accepted when there's no head yet, or when its number is not lower than the head
 * number and its hash differs from the head hash. Same height with another hash (a reorg) is
 * accepted, older heights are dropped.
 *
 * Not thread-safe: a single task owns the instance.
 */
class Reconciler {
  public:
    //! \return true if header became the new head
    bool reconcile(const HeaderPtr& header);

    const std::optional<HeadState>& head() const { return head_; }

  private:
    std::optional<HeadState> head_;
};

}  // namespace blocksub
