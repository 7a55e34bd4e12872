/**
 * @file test_rs1024.cpp
 * @brief Unit tests for the RS1024 mnemonic checksum.
 * @author Arkenstone Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/rs1024.hpp"

#include <vector>

using namespace Arkenstone;

static std::vector<uint16_t> sampleData() {
    std::vector<uint16_t> data;
    for (uint16_t i = 0; i < 17; ++i) {
        data.push_back(static_cast<uint16_t>((i * 389 + 71) % 1024));
    }
    return data;
}

static std::vector<uint16_t> withChecksum(std::vector<uint16_t> data) {
    const auto checksum = RS1024::createChecksum(data);
    data.insert(data.end(), checksum.begin(), checksum.end());
    return data;
}

TEST_CASE("RS1024 checksum makes the sequence verify", "[createChecksum]") {
    const auto full = withChecksum(sampleData());

    REQUIRE(full.size() == sampleData().size() + CHECKSUM_LENGTH_WORDS);
    for (auto s : full) {
        REQUIRE(s < 1024);
    }
    REQUIRE(RS1024::verifyChecksum(full));
    REQUIRE_NOTHROW(RS1024::requireValid(full));
}

TEST_CASE("RS1024 detects every single-symbol substitution", "[verifyChecksum]") {
    const auto full = withChecksum(sampleData());

    for (std::size_t pos = 0; pos < full.size(); ++pos) {
        for (uint16_t delta = 1; delta < 1024; ++delta) {
            auto corrupted = full;
            corrupted[pos] = static_cast<uint16_t>(corrupted[pos] ^ delta);
            REQUIRE_FALSE(RS1024::verifyChecksum(corrupted));
        }
    }
}

TEST_CASE("RS1024 detects swapped neighbours and dropped symbols", "[verifyChecksum]") {
    const auto full = withChecksum(sampleData());

    auto swapped = full;
    std::swap(swapped[3], swapped[4]);
    REQUIRE_FALSE(RS1024::verifyChecksum(swapped));

    auto dropped = full;
    dropped.erase(dropped.begin() + 5);
    REQUIRE_FALSE(RS1024::verifyChecksum(dropped));
}

TEST_CASE("RS1024::requireValid throws InvalidChecksum", "[requireValid]") {
    auto full = withChecksum(sampleData());
    full.back() ^= 1;

    REQUIRE_THROWS_AS(RS1024::requireValid(full), InvalidChecksum);
    REQUIRE_THROWS_AS(RS1024::requireValid(full), DecodeError);
}

TEST_CASE("RS1024 polymod of the empty sequence is the initial residue", "[polymod]") {
    REQUIRE(RS1024::polymod({}) == 1);
}
