/**
 * @file test_mnemonic_scheme.cpp
 * @brief Unit tests for Arkenstone::MnemonicScheme using Catch2.
 * @author Arkenstone Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/hex.hpp"
#include "../include/mnemonic_scheme.hpp"

#include <string>
#include <vector>

using namespace Arkenstone;

static const Wordlist& wordlist() {
    static const Wordlist list = Wordlist::loadFromFile(ARKENSTONE_WORDLIST_PATH);
    return list;
}

static const MnemonicScheme& scheme() {
    static const GF256 field;
    static const MnemonicScheme s(field, wordlist());
    return s;
}

static std::vector<std::string> pick(const std::vector<std::string>& all, unsigned mask) {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < all.size(); ++i) {
        if (mask & (1u << i)) out.push_back(all[i]);
    }
    return out;
}

static unsigned popcount(unsigned v) {
    unsigned n = 0;
    for (; v; v >>= 1) n += v & 1;
    return n;
}

TEST_CASE("Known single-share vector", "[combine]") {
    const std::vector<std::string> mnemonics = {
        "duckling enlarge academic academic agency result length solution fridge kidney "
        "coal piece deal husband erode duke ajar critical decision keyboard"
    };
    REQUIRE(hexEncode(scheme().combine(mnemonics, "TREZOR")) == "bb54aac4b89dc868ba37d9cc21b2cece");
}

TEST_CASE("Known two-share vector", "[combine]") {
    const std::vector<std::string> mnemonics = {
        "shadow pistol academic always adequate wildlife fancy gross oasis cylinder "
        "mustang wrist rescue view short owner flip making coding armed",
        "shadow pistol academic acid actress prayer class unknown daughter sweater "
        "depict flip twice unkind craft early superior advocate guest smoking"
    };
    REQUIRE(hexEncode(scheme().combine(mnemonics, "TREZOR")) == "b43ceb7e57a0ea8766221624d01b0864");

    REQUIRE_THROWS_AS(scheme().combine({mnemonics[0]}, "TREZOR"), NotEnoughGroups);
}

TEST_CASE("Single group threshold 3 of 5", "[generate][combine]") {
    const SecureBytes secret(16, 0);
    const auto mnemonics = scheme().generate(1, {GroupSpec{3, 5}}, secret);

    REQUIRE(mnemonics.size() == 1);
    REQUIRE(mnemonics[0].size() == 5);

    for (unsigned mask = 0; mask < 32; ++mask) {
        const auto subset = pick(mnemonics[0], mask);
        if (popcount(mask) >= 3) {
            REQUIRE(scheme().combine(subset) == secret);
        } else if (popcount(mask) > 0) {
            REQUIRE_THROWS_AS(scheme().combine(subset), NotEnoughGroups);
        }
    }
}

TEST_CASE("Two of three groups", "[generate][combine]") {
    const SecureBytes secret = hexDecode("0f1e2d3c4b5a69788796a5b4c3d2e1f00112233445566778");
    const std::vector<GroupSpec> groups = {GroupSpec{2, 3}, GroupSpec{1, 1}, GroupSpec{3, 4}};
    const auto mnemonics = scheme().generate(2, groups, secret, "TREZOR", 1);

    REQUIRE(mnemonics.size() == 3);
    REQUIRE(mnemonics[0].size() == 3);
    REQUIRE(mnemonics[1].size() == 1);
    REQUIRE(mnemonics[2].size() == 4);

    // A sufficient subset from each of two groups
    const std::vector<std::vector<std::string>> enough = {
        {mnemonics[0][0], mnemonics[0][2]},
        {mnemonics[1][0]},
        {mnemonics[2][3], mnemonics[2][0], mnemonics[2][1]},
    };

    for (std::size_t a = 0; a < enough.size(); ++a) {
        for (std::size_t b = a + 1; b < enough.size(); ++b) {
            std::vector<std::string> set = enough[a];
            set.insert(set.end(), enough[b].begin(), enough[b].end());
            REQUIRE(scheme().combine(set, "TREZOR") == secret);
        }
        REQUIRE_THROWS_AS(scheme().combine(enough[a], "TREZOR"), NotEnoughGroups);
    }

    // Extra shares and complete groups are ignored
    std::vector<std::string> all;
    for (const auto& g : mnemonics) all.insert(all.end(), g.begin(), g.end());
    REQUIRE(scheme().combine(all, "TREZOR") == secret);

    // One group complete, another one short
    REQUIRE_THROWS_AS(scheme().combine({mnemonics[1][0], mnemonics[2][0], mnemonics[2][1]}, "TREZOR"),
                      NotEnoughGroups);
}

TEST_CASE("Wrong passphrase yields a different secret", "[combine]") {
    const SecureBytes secret = hexDecode("00112233445566778899aabbccddeeff");
    const auto mnemonics = scheme().generate(1, {GroupSpec{1, 1}}, secret, "correct");

    const SecureBytes other = scheme().combine(mnemonics[0], "incorrect");
    REQUIRE(other.size() == secret.size());
    REQUIRE(other != secret);
    REQUIRE(scheme().combine(mnemonics[0], "correct") == secret);
}

TEST_CASE("Master share recovers alone", "[generate][combine]") {
    const SecureBytes secret(32, 0xAB);
    const auto mnemonics = scheme().generate(1, {GroupSpec{1, 1}, GroupSpec{3, 5}}, secret);

    REQUIRE(mnemonics[0][0].size() > 0);
    REQUIRE(scheme().combine({mnemonics[0][0]}) == secret);
    REQUIRE(scheme().combine({mnemonics[1][4], mnemonics[1][1], mnemonics[1][2]}) == secret);
}

TEST_CASE("Random master secret", "[generateRandom]") {
    const auto split = scheme().generateRandom(1, {GroupSpec{2, 3}}, 256);
    REQUIRE(split.masterSecret.size() == 32);
    REQUIRE(scheme().combine({split.mnemonics[0][1], split.mnemonics[0][2]}) == split.masterSecret);

    REQUIRE_THROWS_AS(scheme().generateRandom(1, {GroupSpec{2, 3}}, 120), InvalidSecretLength);
    REQUIRE_THROWS_AS(scheme().generateRandom(1, {GroupSpec{2, 3}}, 136), InvalidSecretLength);
}

TEST_CASE("Split parameters are validated", "[generate]") {
    const SecureBytes secret(16, 1);

    REQUIRE_THROWS_AS(scheme().generate(1, {GroupSpec{1, 2}}, secret), InvalidParameters);
    REQUIRE_THROWS_AS(scheme().generate(1, {}, secret), InvalidParameters);
    REQUIRE_THROWS_AS(scheme().generate(2, {GroupSpec{2, 3}}, secret), InvalidParameters);
    REQUIRE_THROWS_AS(scheme().generate(0, {GroupSpec{2, 3}}, secret), InvalidParameters);
    REQUIRE_THROWS_AS(scheme().generate(1, {GroupSpec{4, 3}}, secret), InvalidParameters);
    REQUIRE_THROWS_AS(scheme().generate(1, {GroupSpec{2, 17}}, secret), InvalidParameters);
    REQUIRE_THROWS_AS(scheme().generate(1, std::vector<GroupSpec>(17, GroupSpec{1, 1}), secret), InvalidParameters);
    REQUIRE_THROWS_AS(scheme().generate(1, {GroupSpec{2, 3}}, secret, "", 32), InvalidParameters);

    REQUIRE_THROWS_AS(scheme().generate(1, {GroupSpec{2, 3}}, SecureBytes(14, 1)), InvalidSecretLength);
    REQUIRE_THROWS_AS(scheme().generate(1, {GroupSpec{2, 3}}, SecureBytes(17, 1)), InvalidSecretLength);
    REQUIRE_THROWS_AS(scheme().generate(1, {GroupSpec{2, 3}}, secret, "caf\xc3\xa9"), InvalidPassphraseEncoding);

    REQUIRE(scheme().generate(1, {GroupSpec{16, 16}}, SecureBytes(18, 1))[0].size() == 16);
}

TEST_CASE("Mixed sets are rejected", "[combine]") {
    const SecureBytes secret(16, 7);
    const std::vector<GroupSpec> groups = {GroupSpec{2, 3}};

    SECTION("Different identifiers") {
        const auto a = scheme().generateShares(1, 1, groups, secret);
        const auto b = scheme().generateShares(2, 1, groups, secret);
        REQUIRE_THROWS_AS(scheme().combineShares({a[0][0], b[0][1]}), MnemonicSetMismatch);
    }

    SECTION("Different iteration exponents") {
        const auto a = scheme().generateShares(5, 1, groups, secret, "", 0);
        const auto b = scheme().generateShares(5, 1, groups, secret, "", 1);
        REQUIRE_THROWS_AS(scheme().combineShares({a[0][0], b[0][1]}), MnemonicSetMismatch);
    }

    SECTION("Same identifier, different splits") {
        const auto a = scheme().generateShares(9, 1, groups, secret);
        const auto b = scheme().generateShares(9, 1, groups, secret);
        REQUIRE_THROWS_AS(scheme().combineShares({a[0][0], b[0][1]}), DigestMismatch);
        REQUIRE_THROWS_AS(scheme().combineShares({a[0][0], b[0][0]}), DuplicateMemberIndex);
    }

    SECTION("Repeated share counts once") {
        const auto a = scheme().generateShares(11, 1, groups, secret);
        REQUIRE_THROWS_AS(scheme().combineShares({a[0][0], a[0][0]}), NotEnoughGroups);
        REQUIRE(scheme().combineShares({a[0][0], a[0][0], a[0][2]}) == secret);
    }

    SECTION("Different secret lengths") {
        const auto a = scheme().generateShares(500, 1, groups, secret);
        const auto b = scheme().generateShares(500, 1, groups, SecureBytes(32, 7));
        try {
            scheme().combineShares({a[0][0], b[0][1]});
            FAIL("Expected MnemonicSetMismatch");
        } catch (const SetConsistency& e) {
            REQUIRE(e.kind() == ErrorKind::MnemonicSetMismatch);
        }
        REQUIRE_THROWS_AS(scheme().combine({a[0][0].mnemonic(wordlist()), b[0][1].mnemonic(wordlist())}),
                          MnemonicSetMismatch);
    }

    SECTION("Empty list") {
        REQUIRE_THROWS_AS(scheme().combine({}), NotEnoughGroups);
    }
}

TEST_CASE("Generated shares carry the split parameters", "[generateShares]") {
    const SecureBytes secret(16, 3);
    const auto groups = scheme().generateShares(31000, 2, {GroupSpec{2, 2}, GroupSpec{3, 4}}, secret, "", 3);

    for (std::size_t g = 0; g < groups.size(); ++g) {
        for (std::size_t m = 0; m < groups[g].size(); ++m) {
            const Share& share = groups[g][m];
            REQUIRE(share.identifier == 31000);
            REQUIRE(share.iterationExponent == 3);
            REQUIRE(share.groupIndex == g);
            REQUIRE(share.groupThreshold == 2);
            REQUIRE(share.groupCount == 2);
            REQUIRE(share.memberIndex == m);
            REQUIRE(share.value.size() == secret.size());
            REQUIRE(Share::fromMnemonic(wordlist(), share.mnemonic(wordlist())) == share);
        }
    }
    REQUIRE(groups[1][0].memberThreshold == 3);
}
