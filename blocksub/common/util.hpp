// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

namespace blocksub {

using Bytes = std::basic_string<uint8_t>;
using ByteView = std::basic_string_view<uint8_t>;

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

inline std::string to_hex(const evmc::bytes32& hash, bool with_prefix = true) {
    return to_hex(ByteView{hash.bytes, sizeof(hash.bytes)}, with_prefix);
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Decodes a hex string, with or without 0x prefix. An odd number of digits is left padded with 0
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Decodes a hex string into a 32-byte hash, shorter inputs are left padded with zeroes
std::optional<evmc::bytes32> bytes32_from_hex(std::string_view hex) noexcept;

//! \brief Decodes a JSON-RPC quantity (0x-prefixed hex, no leading zeroes required)
std::optional<uint64_t> from_quantity(std::string_view hex) noexcept;

//! \brief Encodes a JSON-RPC quantity, e.g. 0x0 or 0x1b4
std::string to_quantity(uint64_t value);

//! \brief Abridges a string to given length, appending an ellipsis if it was longer
std::string abridge(std::string_view input, size_t length);

}  // namespace blocksub
