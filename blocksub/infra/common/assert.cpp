// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "assert.hpp"

#include <cstdlib>
#include <iostream>

namespace blocksub {

void abort_due_to_assertion_failure(const char* expr, const char* file, int line) {
    std::cerr << "Assertion failed: " << expr << " at " << file << ":" << line << std::endl;
    std::abort();
}

}  // namespace blocksub
