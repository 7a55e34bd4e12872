#include "../include/share.hpp"
#include "../include/rs1024.hpp"

#include <functional>
#include <string>

/**
 * @file share.cpp
 * @brief Share encoding to word indices and decoding back.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    namespace {

        void checkField(unsigned value, unsigned lo, unsigned hi, const char* name) {
            if (value < lo || value > hi)
                throw InvalidParameters(std::string("Share field out of range: ") + name);
        }
    }

    std::vector<uint16_t> Share::indices() const {
        checkField(identifier, 0, MAX_IDENTIFIER, "identifier");
        checkField(iterationExponent, 0, MAX_ITERATION_EXPONENT, "iteration exponent");
        checkField(groupIndex, 0, MAX_SHARE_COUNT - 1, "group index");
        checkField(groupThreshold, 1, MAX_SHARE_COUNT, "group threshold");
        checkField(groupCount, 1, MAX_SHARE_COUNT, "group count");
        checkField(memberIndex, 0, MAX_SHARE_COUNT - 1, "member index");
        checkField(memberThreshold, 1, MAX_SHARE_COUNT, "member threshold");

        const uint64_t idExp = (static_cast<uint64_t>(identifier) << ITERATION_EXP_LENGTH_BITS) | iterationExponent;

        // group index | group threshold-1 | group count-1 | member index | member threshold-1, 4 bits each
        const uint64_t groupFields =
            (static_cast<uint64_t>(groupIndex) << 16) |
            (static_cast<uint64_t>(groupThreshold - 1) << 12) |
            (static_cast<uint64_t>(groupCount - 1) << 8) |
            (static_cast<uint64_t>(memberIndex) << 4) |
            static_cast<uint64_t>(memberThreshold - 1);

        std::vector<uint16_t> data = WordCodec::intToIndices(idExp, ID_EXP_LENGTH_WORDS);
        const std::vector<uint16_t> group = WordCodec::intToIndices(groupFields, 2);
        const std::vector<uint16_t> val = WordCodec::bytesToIndices(value.data(), value.size());
        data.insert(data.end(), group.begin(), group.end());
        data.insert(data.end(), val.begin(), val.end());

        const RS1024::Checksum checksum = RS1024::createChecksum(data);
        data.insert(data.end(), checksum.begin(), checksum.end());
        return data;
    }

    std::vector<std::string> Share::words(const Wordlist& wordlist) const {
        std::vector<std::string> out;
        for (uint16_t i : indices()) {
            out.push_back(wordlist.word(i));
        }
        return out;
    }

    std::string Share::mnemonic(const Wordlist& wordlist) const {
        return wordlist.mnemonicFromIndices(indices());
    }

    std::string Share::groupPrefix(const Wordlist& wordlist) const {
        std::vector<uint16_t> data = indices();
        data.resize(GROUP_PREFIX_LENGTH_WORDS);
        return wordlist.mnemonicFromIndices(data);
    }

    Share Share::fromMnemonic(const Wordlist& wordlist, const std::string& mnemonic) {
        return fromIndices(WordCodec::decode(wordlist, mnemonic));
    }

    Share Share::fromIndices(const std::vector<uint16_t>& data) {
        if (data.size() < MIN_MNEMONIC_LENGTH_WORDS)
            throw InvalidWordCount("Invalid mnemonic length. The length of each mnemonic must be at least " +
                                   std::to_string(MIN_MNEMONIC_LENGTH_WORDS) + " words.");

        const std::size_t valueWords = data.size() - METADATA_LENGTH_WORDS;
        const std::size_t paddingBits = (RADIX_BITS * valueWords) % 16;
        if (paddingBits > 8)
            throw InvalidWordCount("Invalid mnemonic length.");

        RS1024::requireValid(data);

        Share share;

        const uint64_t idExp = WordCodec::intFromIndices(data.data(), ID_EXP_LENGTH_WORDS);
        share.identifier = static_cast<uint16_t>(idExp >> ITERATION_EXP_LENGTH_BITS);
        share.iterationExponent = static_cast<uint8_t>(idExp & MAX_ITERATION_EXPONENT);

        const uint64_t groupFields = WordCodec::intFromIndices(data.data() + ID_EXP_LENGTH_WORDS, 2);
        share.groupIndex = static_cast<uint8_t>((groupFields >> 16) & 0xF);
        share.groupThreshold = static_cast<uint8_t>(((groupFields >> 12) & 0xF) + 1);
        share.groupCount = static_cast<uint8_t>(((groupFields >> 8) & 0xF) + 1);
        share.memberIndex = static_cast<uint8_t>((groupFields >> 4) & 0xF);
        share.memberThreshold = static_cast<uint8_t>((groupFields & 0xF) + 1);

        if (share.groupCount < share.groupThreshold)
            throw InvalidShareHeader("Invalid mnemonic. Group threshold cannot be greater than group count.");
        if (share.groupIndex >= share.groupCount)
            throw InvalidShareHeader("Invalid mnemonic. Group index must be less than group count.");

        const std::size_t valueBytes = (RADIX_BITS * valueWords - paddingBits) / 8;
        share.value = WordCodec::bytesFromIndices(data.data() + ID_EXP_LENGTH_WORDS + 2, valueWords, valueBytes);

        return share;
    }

    bool Share::operator==(const Share& o) const {
        return identifier == o.identifier &&
               iterationExponent == o.iterationExponent &&
               groupIndex == o.groupIndex &&
               groupThreshold == o.groupThreshold &&
               groupCount == o.groupCount &&
               memberIndex == o.memberIndex &&
               memberThreshold == o.memberThreshold &&
               value.size() == o.value.size() &&
               constant_time_equal(value.data(), o.value.data(), value.size());
    }

    std::size_t ShareHash::operator()(const Share& share) const noexcept {
        std::size_t h = std::hash<uint64_t>{}(
            (static_cast<uint64_t>(share.identifier) << 32) |
            (static_cast<uint64_t>(share.iterationExponent) << 24) |
            (static_cast<uint64_t>(share.groupIndex) << 20) |
            (static_cast<uint64_t>(share.groupThreshold) << 15) |
            (static_cast<uint64_t>(share.groupCount) << 10) |
            (static_cast<uint64_t>(share.memberIndex) << 5) |
            static_cast<uint64_t>(share.memberThreshold));
        for (uint8_t b : share.value) {
            h ^= std::hash<uint8_t>{}(b) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        }
        return h;
    }

} // namespace Arkenstone
