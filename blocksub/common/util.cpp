// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>

namespace blocksub {

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.length() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{out.data()};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return static_cast<uint8_t>(ch - '0');
    if (ch >= 'a' && ch <= 'f') return static_cast<uint8_t>(ch - 'a' + 10);
    if (ch >= 'A' && ch <= 'F') return static_cast<uint8_t>(ch - 'A' + 10);
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    Bytes out((hex.length() + 1) / 2, 0);
    auto dest{out.begin()};
    if (hex.length() % 2 != 0) {
        const auto lo{decode_hex_digit(hex[0])};
        if (!lo) return std::nullopt;
        *dest++ = *lo;
        hex.remove_prefix(1);
    }
    for (size_t i{0}; i < hex.length(); i += 2) {
        const auto hi{decode_hex_digit(hex[i])};
        const auto lo{decode_hex_digit(hex[i + 1])};
        if (!hi || !lo) return std::nullopt;
        *dest++ = static_cast<uint8_t>((*hi << 4) | *lo);
    }
    return out;
}

std::optional<evmc::bytes32> bytes32_from_hex(std::string_view hex) noexcept {
    const auto bytes{from_hex(hex)};
    if (!bytes || bytes->length() > sizeof(evmc::bytes32)) {
        return std::nullopt;
    }
    evmc::bytes32 out{};
    std::copy(bytes->begin(), bytes->end(), out.bytes + sizeof(out.bytes) - bytes->length());
    return out;
}

std::optional<uint64_t> from_quantity(std::string_view hex) noexcept {
    if (!has_hex_prefix(hex)) return std::nullopt;
    hex.remove_prefix(2);
    if (hex.empty() || hex.length() > 16) return std::nullopt;

    uint64_t value{0};
    for (const char ch : hex) {
        const auto digit{decode_hex_digit(ch)};
        if (!digit) return std::nullopt;
        value = (value << 4) | *digit;
    }
    return value;
}

std::string to_quantity(uint64_t value) {
    static const char* kHexDigits{"0123456789abcdef"};
    if (value == 0) {
        return "0x0";
    }
    std::string digits;
    while (value != 0) {
        digits.push_back(kHexDigits[value & 0x0f]);
        value >>= 4;
    }
    std::reverse(digits.begin(), digits.end());
    return "0x" + digits;
}

std::string abridge(std::string_view input, size_t length) {
    if (input.length() <= length) {
        return std::string(input);
    }
    return std::string(input.substr(0, length)) + "...";
}

}  // namespace blocksub
