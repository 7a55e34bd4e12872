#include "../include/word_codec.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

/**
 * @file word_codec.cpp
 * @brief Vocabulary loading and 10-bit symbol packing.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    namespace {

        std::string toLower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }
    }

    Wordlist::Wordlist(std::vector<std::string> words)
        : words_(std::move(words)) {
        if (words_.size() != RADIX)
            throw LanguageException("Word list must contain exactly " + std::to_string(RADIX) +
                                    " words, got " + std::to_string(words_.size()));

        lookup_.reserve(words_.size());
        for (std::size_t i = 0; i < words_.size(); ++i) {
            words_[i] = toLower(words_[i]);
            if (!lookup_.emplace(words_[i], static_cast<uint16_t>(i)).second)
                throw LanguageException("Duplicate word in word list: " + words_[i]);
        }
    }

    Wordlist Wordlist::loadFromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file)
            throw LanguageException("Unable to open wordlist file: " + path);

        std::vector<std::string> words;
        words.reserve(RADIX);

        std::string line;
        while (std::getline(file, line)) {

            // remove potential '\r'
            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            if (!line.empty())
                words.push_back(line);
        }

        if (words.size() != RADIX)
            throw LanguageException("Invalid wordlist size in file: " + path);

        return Wordlist(std::move(words));
    }

    const std::string& Wordlist::word(uint16_t index) const {
        return words_.at(index);
    }

    uint16_t Wordlist::index(const std::string& word) const {
        auto it = lookup_.find(toLower(word));
        if (it == lookup_.end())
            throw UnknownWord("Invalid mnemonic word: " + word);
        return it->second;
    }

    std::string Wordlist::mnemonicFromIndices(const std::vector<uint16_t>& indices) const {
        std::string out;
        for (std::size_t i = 0; i < indices.size(); ++i) {
            if (i != 0) out.push_back(' ');
            out += word(indices[i]);
        }
        return out;
    }

    std::vector<uint16_t> Wordlist::indicesFromMnemonic(const std::string& mnemonic) const {
        std::istringstream ss(mnemonic);
        std::vector<uint16_t> indices;
        std::string token;
        while (ss >> token) {
            indices.push_back(index(token));
        }
        return indices;
    }

    std::vector<uint16_t> WordCodec::intToIndices(uint64_t value, std::size_t count) {
        std::vector<uint16_t> indices(count);
        for (std::size_t i = 0; i < count; ++i) {
            const std::size_t shift = RADIX_BITS * (count - 1 - i);
            indices[i] = static_cast<uint16_t>((value >> shift) & (RADIX - 1));
        }
        return indices;
    }

    uint64_t WordCodec::intFromIndices(const uint16_t* indices, std::size_t count) {
        if (count * RADIX_BITS > 64)
            throw std::invalid_argument("Too many words for a 64-bit integer");

        uint64_t value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            value = (value << RADIX_BITS) | (indices[i] & (RADIX - 1));
        }
        return value;
    }

    std::vector<uint16_t> WordCodec::bytesToIndices(const uint8_t* data, std::size_t len) {
        const std::size_t count = wordCountForBytes(len);

        std::vector<uint16_t> indices;
        indices.reserve(count);

        // The leading padding bits are zero, so they only shift the word boundaries.
        unsigned bitsInAccumulator = static_cast<unsigned>(count * RADIX_BITS - len * 8);
        uint32_t accumulator = 0;

        for (std::size_t i = 0; i < len; ++i) {
            accumulator = (accumulator << 8) | data[i];
            bitsInAccumulator += 8;

            while (bitsInAccumulator >= RADIX_BITS) {
                bitsInAccumulator -= RADIX_BITS;
                indices.push_back(static_cast<uint16_t>((accumulator >> bitsInAccumulator) & (RADIX - 1)));
            }
            accumulator &= (1u << bitsInAccumulator) - 1;
        }

        return indices;
    }

    SecureBytes WordCodec::bytesFromIndices(const uint16_t* indices, std::size_t count, std::size_t byteCount) {
        const std::size_t totalBits = count * RADIX_BITS;
        if (byteCount * 8 > totalBits || totalBits - byteCount * 8 >= RADIX_BITS)
            throw InvalidPadding("Invalid mnemonic padding length");

        const unsigned padding = static_cast<unsigned>(totalBits - byteCount * 8);

        SecureBytes out;
        out.reserve(byteCount);
        if (count == 0) return out;

        if (indices[0] >= (1u << (RADIX_BITS - padding)))
            throw InvalidPadding("Invalid mnemonic padding");

        uint32_t accumulator = indices[0] & ((1u << (RADIX_BITS - padding)) - 1);
        unsigned bitsInAccumulator = RADIX_BITS - padding;

        for (std::size_t i = 0;; ) {
            while (bitsInAccumulator >= 8) {
                bitsInAccumulator -= 8;
                out.push_back(static_cast<uint8_t>((accumulator >> bitsInAccumulator) & 0xFF));
            }
            accumulator &= (1u << bitsInAccumulator) - 1;

            if (++i == count) break;
            accumulator = (accumulator << RADIX_BITS) | (indices[i] & (RADIX - 1));
            bitsInAccumulator += RADIX_BITS;
        }

        secure_memzero(&accumulator, sizeof(accumulator));
        return out;
    }

    std::vector<uint16_t> WordCodec::decode(const Wordlist& wordlist,
                                            const std::string& mnemonic,
                                            std::size_t minWords) {
        std::vector<uint16_t> indices = wordlist.indicesFromMnemonic(mnemonic);
        if (indices.size() < minWords)
            throw InvalidWordCount("Invalid mnemonic length. The length of each mnemonic must be at least " +
                                   std::to_string(minWords) + " words.");
        return indices;
    }

} // namespace Arkenstone
