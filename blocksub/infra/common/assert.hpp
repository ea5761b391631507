// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace blocksub {
[[noreturn]] void abort_due_to_assertion_failure(const char* expr, const char* file, int line);
}

// BLOCKSUB_ASSERT aborts on failure regardless of NDEBUG. Reserved for internal invariants.
#define BLOCKSUB_ASSERT(expr) \
    if ((expr)) [[likely]]    \
        static_cast<void>(0); \
    else                      \
        ::blocksub::abort_due_to_assertion_failure(#expr, __FILE__, __LINE__)
