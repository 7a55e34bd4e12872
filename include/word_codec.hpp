#ifndef WORD_CODEC_HPP
#define WORD_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "constants.hpp"
#include "exceptions.hpp"
#include "secure_string.hpp"

/**
 * @file word_codec.hpp
 * @brief Vocabulary of 1024 words and packing of bit fields into 10-bit word indices.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @class Wordlist
     * @brief Immutable 1024-word vocabulary with reverse lookup.
     *
     * Load it once at startup and pass it by reference to whatever encodes
     * or decodes shares.
     */
    class Wordlist {
    public:
        /**
         * @brief Build a vocabulary from an ordered list of words.
         * @throw LanguageException If there are not exactly 1024 distinct words.
         */
        explicit Wordlist(std::vector<std::string> words);

        /**
         * @brief Load a vocabulary file, one word per line.
         * @param path Path of the word list.
         * @throw LanguageException If the file cannot be read or is malformed.
         */
        static Wordlist loadFromFile(const std::string& path);

        /**
         * @throw std::out_of_range If index >= 1024.
         */
        const std::string& word(uint16_t index) const;

        /**
         * @brief Index of a word, case-insensitive.
         * @throw UnknownWord If the word is not in the vocabulary.
         */
        uint16_t index(const std::string& word) const;

        std::size_t size() const { return words_.size(); }

        /**
         * @brief Space-separated words for the given indices.
         */
        std::string mnemonicFromIndices(const std::vector<uint16_t>& indices) const;

        /**
         * @brief Word indices of a whitespace-separated mnemonic.
         * @throw UnknownWord On the first word not in the vocabulary.
         */
        std::vector<uint16_t> indicesFromMnemonic(const std::string& mnemonic) const;

    private:
        std::vector<std::string> words_;
        std::unordered_map<std::string, uint16_t> lookup_;
    };

    /**
     * @class WordCodec
     * @brief Big-endian bit packing between integers or byte strings and 10-bit symbols.
     */
    class WordCodec {
    public:
        /**
         * @brief Split the low count*10 bits of value into count symbols, most significant first.
         */
        static std::vector<uint16_t> intToIndices(uint64_t value, std::size_t count);

        /**
         * @brief Inverse of intToIndices. count must be at most 6.
         */
        static uint64_t intFromIndices(const uint16_t* indices, std::size_t count);

        /**
         * @brief Number of words needed to hold byteCount bytes.
         */
        static std::size_t wordCountForBytes(std::size_t byteCount) {
            return (byteCount * 8 + RADIX_BITS - 1) / RADIX_BITS;
        }

        /**
         * @brief Pack bytes into ceil(8*len/10) symbols, zero-padded on the left.
         */
        static std::vector<uint16_t> bytesToIndices(const uint8_t* data, std::size_t len);

        /**
         * @brief Unpack symbols into byteCount bytes.
         *
         * The 10*count - 8*byteCount leading bits are padding and must be zero.
         *
         * @throw InvalidPadding If the padding is negative, longer than a word, or non-zero.
         */
        static SecureBytes bytesFromIndices(const uint16_t* indices, std::size_t count, std::size_t byteCount);

        /**
         * @brief Parse a mnemonic and check it is long enough to hold a share.
         * @throw UnknownWord If a word is not in the vocabulary.
         * @throw InvalidWordCount If there are fewer than minWords words.
         */
        static std::vector<uint16_t> decode(const Wordlist& wordlist,
                                            const std::string& mnemonic,
                                            std::size_t minWords = MIN_MNEMONIC_LENGTH_WORDS);
    };

} // namespace Arkenstone

#endif // WORD_CODEC_HPP
