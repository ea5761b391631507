// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "reconciler.hpp"

#include <memory>

#include <catch2/catch_test_macros.hpp>

namespace blocksub {

using namespace evmc::literals;

static HeaderPtr make_header(BlockNum number, const evmc::bytes32& hash) {
    return std::make_shared<const Header>(Header{.number = number, .hash = hash});
}

TEST_CASE("Reconciler.first_header_is_accepted", "[core][reconciler]") {
    Reconciler reconciler;
    CHECK_FALSE(reconciler.head());
    CHECK(reconciler.reconcile(make_header(100, 0x01_bytes32)));
    REQUIRE(reconciler.head());
    CHECK(reconciler.head()->number == 100);
    CHECK(reconciler.head()->hash == 0x01_bytes32);
}

TEST_CASE("Reconciler.null_header_is_ignored", "[core][reconciler]") {
    Reconciler reconciler;
    CHECK_FALSE(reconciler.reconcile(nullptr));
    CHECK_FALSE(reconciler.head());
}

TEST_CASE("Reconciler.head_never_regresses", "[core][reconciler]") {
    Reconciler reconciler;
    CHECK(reconciler.reconcile(make_header(5, 0x05_bytes32)));
    CHECK(reconciler.reconcile(make_header(7, 0x07_bytes32)));
    CHECK_FALSE(reconciler.reconcile(make_header(6, 0x06_bytes32)));
    CHECK(reconciler.head()->number == 7);
    CHECK(reconciler.reconcile(make_header(8, 0x08_bytes32)));
    CHECK(reconciler.head()->number == 8);
}

TEST_CASE("Reconciler.duplicate_is_rejected", "[core][reconciler]") {
    Reconciler reconciler;
    auto header = make_header(10, 0xaa_bytes32);
    CHECK(reconciler.reconcile(header));
    CHECK_FALSE(reconciler.reconcile(header));
    CHECK_FALSE(reconciler.reconcile(make_header(10, 0xaa_bytes32)));
}

TEST_CASE("Reconciler.reorg_at_same_height_is_accepted", "[core][reconciler]") {
    Reconciler reconciler;
    CHECK(reconciler.reconcile(make_header(10, 0x0a_bytes32)));
    CHECK(reconciler.reconcile(make_header(10, 0x0b_bytes32)));
    CHECK(reconciler.head()->hash == 0x0b_bytes32);

    // the replaced hash is a different hash at the same height, accepted again
    CHECK(reconciler.reconcile(make_header(10, 0x0a_bytes32)));
}

TEST_CASE("Reconciler.superseded_height_is_rejected", "[core][reconciler]") {
    Reconciler reconciler;
    CHECK(reconciler.reconcile(make_header(10, 0x0a_bytes32)));
    CHECK(reconciler.reconcile(make_header(11, 0x11_bytes32)));
    CHECK_FALSE(reconciler.reconcile(make_header(10, 0x0b_bytes32)));
    CHECK(reconciler.head()->number == 11);
}

TEST_CASE("Reconciler.accepted_sequence_is_non_decreasing", "[core][reconciler]") {
    Reconciler reconciler;
    const BlockNum numbers[]{3, 1, 4, 1, 5, 9, 2, 6, 5, 3, 5, 8, 9, 7, 9};
    BlockNum last_accepted{0};
    uint8_t salt{0};
    for (const auto number : numbers) {
        evmc::bytes32 hash{number};
        hash.bytes[0] = ++salt;
        if (reconciler.reconcile(make_header(number, hash))) {
            CHECK(number >= last_accepted);
            last_accepted = number;
        }
    }
    CHECK(reconciler.head()->number == 9);
}

}  // namespace blocksub
