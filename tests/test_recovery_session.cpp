/**
 * @file test_recovery_session.cpp
 * @brief Unit tests for Arkenstone::RecoverySession using Catch2.
 * @author Arkenstone Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/recovery_session.hpp"

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

/**
 * @brief Mnemonics of a 2-of-3 group split: (2 of 3), (2 of 2), (1 of 1).
 */
static std::vector<std::vector<std::string>> split(uint16_t identifier, const SecureBytes& secret) {
    const auto shares = scheme().generateShares(identifier, 2,
                                                {GroupSpec{2, 3}, GroupSpec{2, 2}, GroupSpec{1, 1}},
                                                secret, "TREZOR");
    std::vector<std::vector<std::string>> out;
    for (const auto& group : shares) {
        std::vector<std::string> words;
        for (const auto& share : group) words.push_back(share.mnemonic(wordlist()));
        out.push_back(words);
    }
    return out;
}

TEST_CASE("Empty session", "[RecoverySession]") {
    RecoverySession session(scheme());

    REQUIRE(session.state() == SessionState::Empty);
    REQUIRE_FALSE(session.isComplete());
    REQUIRE_FALSE(session.groupIsComplete(0));
    REQUIRE(session.status().groups.empty());
    REQUIRE_THROWS_AS(session.groupPrefix(0), InvalidParameters);
    REQUIRE_THROWS_AS(session.recover(), NotEnoughGroups);
}

TEST_CASE("Session collects shares until complete", "[RecoverySession]") {
    const SecureBytes secret(16, 0x3C);
    const auto m = split(4242, secret);
    RecoverySession session(scheme());

    AcceptResult result = session.accept("this is not a mnemonic");
    REQUIRE(result.status == AcceptResult::Status::DecodeFailed);
    REQUIRE(result.error == ErrorKind::UnknownWord);
    REQUIRE(session.state() == SessionState::Empty);

    REQUIRE(session.accept(m[0][0]).accepted());
    REQUIRE(session.state() == SessionState::Collecting);
    REQUIRE_FALSE(session.groupIsComplete(0));

    SessionStatus status = session.status();
    REQUIRE(status.groupThreshold == 2);
    REQUIRE(status.groupCount == 3);
    REQUIRE(status.completedGroups == 0);
    REQUIRE(status.groups.size() == 3);
    REQUIRE(status.groups[0].state == GroupStatus::State::InProgress);
    REQUIRE(status.groups[0].collected == 1);
    REQUIRE(status.groups[0].memberThreshold == 2);
    REQUIRE(status.groups[1].state == GroupStatus::State::Empty);
    REQUIRE(status.groups[1].memberThreshold == 0);

    REQUIRE(session.accept(m[0][0]).status == AcceptResult::Status::Duplicate);
    REQUIRE(session.mnemonics().size() == 1);

    REQUIRE(session.accept(m[0][2]).accepted());
    REQUIRE(session.groupIsComplete(0));
    REQUIRE(session.completedGroupCount() == 1);
    REQUIRE_FALSE(session.isComplete());
    REQUIRE_THROWS_AS(session.recover("TREZOR"), NotEnoughGroups);

    REQUIRE(session.accept(m[1][1]).accepted());
    REQUIRE(session.state() == SessionState::Collecting);

    REQUIRE(session.accept(m[2][0]).accepted());
    REQUIRE(session.isComplete());
    REQUIRE(session.state() == SessionState::Complete);
    REQUIRE(session.status().completedGroups == 2);

    REQUIRE(session.accept(m[1][0]).status == AcceptResult::Status::Closed);
    REQUIRE(session.mnemonics().size() == 4);

    REQUIRE(session.recover("TREZOR") == secret);
}

TEST_CASE("Session rejects shares that do not fit the set", "[RecoverySession]") {
    const SecureBytes secret(16, 0x11);
    const auto m = split(100, secret);
    RecoverySession session(scheme());
    REQUIRE(session.accept(m[0][1]).accepted());

    SECTION("Different identifier") {
        const auto other = split(101, secret);
        const AcceptResult result = session.accept(other[0][0]);
        REQUIRE(result.status == AcceptResult::Status::Rejected);
        REQUIRE(result.error == ErrorKind::MnemonicSetMismatch);
    }

    SECTION("Same member index, different share") {
        const auto other = split(100, secret);
        const AcceptResult result = session.accept(other[0][1]);
        REQUIRE(result.status == AcceptResult::Status::Rejected);
        REQUIRE(result.error == ErrorKind::DuplicateMemberIndex);
    }

    SECTION("Corrupted word") {
        std::string mnemonic = m[0][0];
        const auto space = mnemonic.rfind(' ');
        mnemonic = mnemonic.substr(0, space) + (mnemonic.substr(space + 1) == "academic" ? " acid" : " academic");
        const AcceptResult result = session.accept(mnemonic);
        REQUIRE(result.status == AcceptResult::Status::DecodeFailed);
        REQUIRE(result.error == ErrorKind::InvalidChecksum);
    }

    REQUIRE(session.mnemonics().size() == 1);
    REQUIRE(session.state() == SessionState::Collecting);
}

TEST_CASE("Session reports mixed splits at recovery", "[RecoverySession]") {
    const SecureBytes secret(16, 0x5E);
    const auto a = split(777, secret);
    const auto b = split(777, secret);
    RecoverySession session(scheme());

    REQUIRE(session.accept(a[0][0]).accepted());
    REQUIRE(session.accept(b[0][1]).accepted());
    REQUIRE(session.accept(a[2][0]).accepted());
    REQUIRE(session.isComplete());

    REQUIRE_THROWS_AS(session.recover("TREZOR"), DigestMismatch);
}

TEST_CASE("Session group prefixes", "[RecoverySession]") {
    const auto m = split(2024, SecureBytes(16, 0));
    RecoverySession session(scheme());
    REQUIRE(session.accept(m[1][0]).accepted());

    const SessionStatus status = session.status();
    for (uint8_t g = 0; g < 3; ++g) {
        const Share first = Share::fromMnemonic(wordlist(), m[g][0]);
        REQUIRE(session.groupPrefix(g) == first.groupPrefix(wordlist()));
        REQUIRE(status.groups[g].prefix == session.groupPrefix(g));
        REQUIRE(m[g][0].compare(0, status.groups[g].prefix.size(), status.groups[g].prefix) == 0);
    }
    REQUIRE(session.groupPrefix(0) != session.groupPrefix(1));
}

TEST_CASE("Cancelled session", "[RecoverySession]") {
    const auto m = split(3, SecureBytes(16, 9));
    RecoverySession session(scheme());
    REQUIRE(session.accept(m[0][0]).accepted());

    session.cancel();
    REQUIRE(session.state() == SessionState::Cancelled);
    REQUIRE(session.mnemonics().empty());
    REQUIRE_FALSE(session.isComplete());
    REQUIRE(session.accept(m[2][0]).status == AcceptResult::Status::Closed);
    REQUIRE_THROWS_AS(session.recover("TREZOR"), NotEnoughGroups);
}

TEST_CASE("Session rejects a share of a different secret length", "[RecoverySession]") {
    const SecureBytes shortSecret(16, 0x21);
    const auto shortSet = scheme().generateShares(500, 1, {GroupSpec{2, 3}}, shortSecret);
    const auto longSet = scheme().generateShares(500, 1, {GroupSpec{2, 3}}, SecureBytes(32, 0x21));
    RecoverySession session(scheme());

    REQUIRE(session.accept(shortSet[0][0].mnemonic(wordlist())).accepted());

    const AcceptResult result = session.accept(longSet[0][1].mnemonic(wordlist()));
    REQUIRE(result.status == AcceptResult::Status::Rejected);
    REQUIRE(result.error == ErrorKind::MnemonicSetMismatch);
    REQUIRE(categoryOf(*result.error) == ErrorCategory::SetConsistency);
    REQUIRE(session.mnemonics().size() == 1);

    // Collecting continues with shares of the right set
    REQUIRE(session.accept(shortSet[0][2].mnemonic(wordlist())).accepted());
    REQUIRE(session.isComplete());
    REQUIRE(session.recover() == shortSecret);
}

TEST_CASE("Session refuses a share outside its group count", "[RecoverySession]") {
    Share share;
    share.identifier = 1234;
    share.groupIndex = 3;
    share.groupThreshold = 1;
    share.groupCount = 2;
    share.value = SecureBytes(16, 0x42);

    RecoverySession session(scheme());
    const AcceptResult result = session.accept(share.mnemonic(wordlist()));
    REQUIRE(result.status == AcceptResult::Status::DecodeFailed);
    REQUIRE(result.error == ErrorKind::InvalidShareHeader);
    REQUIRE(session.state() == SessionState::Empty);
    REQUIRE_FALSE(session.isComplete());
}
