/**
 * @file test_word_codec.cpp
 * @brief Unit tests for Arkenstone::Wordlist and Arkenstone::WordCodec.
 * @author Arkenstone Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/word_codec.hpp"

#include <string>
#include <vector>

using namespace Arkenstone;

static const Wordlist& wordlist() {
    static const Wordlist list = Wordlist::loadFromFile(ARKENSTONE_WORDLIST_PATH);
    return list;
}

TEST_CASE("Wordlist loads the 1024-word vocabulary", "[Wordlist]") {
    const Wordlist& list = wordlist();

    REQUIRE(list.size() == 1024);
    REQUIRE(list.word(0) == "academic");
    REQUIRE(list.word(1023) == "zero");
    REQUIRE(list.index("academic") == 0);
    REQUIRE(list.index("ZERO") == 1023);
    REQUIRE_THROWS_AS(list.word(1024), std::out_of_range);
}

TEST_CASE("Wordlist rejects unknown words", "[Wordlist]") {
    REQUIRE_THROWS_AS(wordlist().index("bitcoin"), UnknownWord);
    REQUIRE_THROWS_AS(wordlist().indicesFromMnemonic("academic acid notaword"), UnknownWord);
}

TEST_CASE("Wordlist rejects malformed vocabularies", "[Wordlist]") {
    REQUIRE_THROWS_AS(Wordlist(std::vector<std::string>{"one", "two", "three"}), LanguageException);

    std::vector<std::string> duplicated(1024, "same");
    REQUIRE_THROWS_AS(Wordlist(duplicated), LanguageException);

    REQUIRE_THROWS_AS(Wordlist::loadFromFile("/nonexistent/wordlist.txt"), LanguageException);
}

TEST_CASE("Wordlist splits mnemonics on any whitespace", "[Wordlist]") {
    const auto indices = wordlist().indicesFromMnemonic("  academic\tacid\n zero ");

    REQUIRE(indices == std::vector<uint16_t>{0, 1, 1023});
    REQUIRE(wordlist().mnemonicFromIndices(indices) == "academic acid zero");
}

TEST_CASE("WordCodec packs integers most significant word first", "[intToIndices]") {
    const uint64_t value = (uint64_t(1023) << 10) | 1;
    const auto indices = WordCodec::intToIndices(value, 2);

    REQUIRE(indices == std::vector<uint16_t>{1023, 1});
    REQUIRE(WordCodec::intFromIndices(indices.data(), indices.size()) == value);

    // Bits above count * 10 are dropped
    REQUIRE(WordCodec::intToIndices(uint64_t(1) << 20, 2) == std::vector<uint16_t>{0, 0});
}

TEST_CASE("WordCodec pads byte strings on the left", "[bytesToIndices]") {
    const std::vector<uint8_t> ones(16, 0xFF);
    const auto indices = WordCodec::bytesToIndices(ones.data(), ones.size());

    // 128 bits in 13 words: 2 leading padding bits
    REQUIRE(indices.size() == 13);
    REQUIRE(WordCodec::wordCountForBytes(16) == 13);
    REQUIRE(WordCodec::wordCountForBytes(32) == 26);
    REQUIRE(indices[0] == 0xFF);
    for (std::size_t i = 1; i < indices.size(); ++i) {
        REQUIRE(indices[i] == 1023);
    }

    const SecureBytes back = WordCodec::bytesFromIndices(indices.data(), indices.size(), 16);
    REQUIRE(std::vector<uint8_t>(back.begin(), back.end()) == ones);
}

TEST_CASE("WordCodec keeps byte order", "[bytesToIndices]") {
    std::vector<uint8_t> bytes;
    for (int i = 0; i < 32; ++i) bytes.push_back(static_cast<uint8_t>(i * 7 + 1));

    const auto indices = WordCodec::bytesToIndices(bytes.data(), bytes.size());
    REQUIRE(indices.size() == 26);

    const SecureBytes back = WordCodec::bytesFromIndices(indices.data(), indices.size(), bytes.size());
    REQUIRE(std::vector<uint8_t>(back.begin(), back.end()) == bytes);
}

TEST_CASE("WordCodec rejects non-zero or oversized padding", "[bytesFromIndices]") {
    std::vector<uint16_t> indices(13, 0);

    // 2 padding bits: the first word must be below 256
    indices[0] = 256;
    REQUIRE_THROWS_AS(WordCodec::bytesFromIndices(indices.data(), indices.size(), 16), InvalidPadding);

    indices[0] = 255;
    REQUIRE_NOTHROW(WordCodec::bytesFromIndices(indices.data(), indices.size(), 16));

    // 13 words cannot hold 17 bytes, and 15 bytes would leave 10 padding bits
    REQUIRE_THROWS_AS(WordCodec::bytesFromIndices(indices.data(), indices.size(), 17), InvalidPadding);
    REQUIRE_THROWS_AS(WordCodec::bytesFromIndices(indices.data(), indices.size(), 15), InvalidPadding);
}

TEST_CASE("WordCodec::decode enforces the minimum mnemonic length", "[decode]") {
    std::string nineteen;
    for (int i = 0; i < 19; ++i) nineteen += "academic ";
    REQUIRE_THROWS_AS(WordCodec::decode(wordlist(), nineteen), InvalidWordCount);

    const std::string twenty = nineteen + "zero";
    REQUIRE(WordCodec::decode(wordlist(), twenty).size() == MIN_MNEMONIC_LENGTH_WORDS);

    REQUIRE_THROWS_AS(WordCodec::decode(wordlist(), twenty + " nope"), UnknownWord);
}
