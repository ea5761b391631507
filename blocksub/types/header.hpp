// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include <evmc/evmc.hpp>

namespace blocksub {

using BlockNum = uint64_t;

//! Block header as observed from a source. Only the fields needed to order heads are decoded,
//! payload keeps the source representation (raw JSON for JSON-RPC sources).
struct Header {
    BlockNum number{0};
    evmc::bytes32 hash{};
    evmc::bytes32 parent_hash{};
    uint64_t timestamp{0};
    std::string payload;
};

//! Headers are immutable once observed and shared among all consumers
using HeaderPtr = std::shared_ptr<const Header>;

std::ostream& operator<<(std::ostream& out, const Header& header);

}  // namespace blocksub
