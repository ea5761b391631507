// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "header.hpp"

#include <blocksub/common/util.hpp>

namespace blocksub {

std::ostream& operator<<(std::ostream& out, const Header& header) {
    out << "#" << header.number << " " << to_hex(header.hash);
    return out;
}

}  // namespace blocksub
