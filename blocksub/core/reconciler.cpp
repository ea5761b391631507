// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "reconciler.hpp"

namespace blocksub {

bool Reconciler::reconcile(const HeaderPtr& header) {
    if (!header) {
        return false;
    }
    if (head_ && (header->number < head_->number || header->hash == head_->hash)) {
        return false;
    }
    head_ = HeadState{header, header->number, header->hash};
    return true;
}

}  // namespace blocksub
