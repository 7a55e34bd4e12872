#ifndef SHARE_HPP
#define SHARE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "constants.hpp"
#include "exceptions.hpp"
#include "secure_string.hpp"
#include "word_codec.hpp"

/**
 * @file share.hpp
 * @brief One mnemonic share: hierarchy metadata, value, and its word encoding.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @brief Parameters every share of one split has in common.
     */
    struct CommonParameters {
        uint16_t identifier = 0;
        uint8_t iterationExponent = 0;
        uint8_t groupThreshold = 0;
        uint8_t groupCount = 0;

        bool operator==(const CommonParameters& o) const {
            return identifier == o.identifier && iterationExponent == o.iterationExponent &&
                   groupThreshold == o.groupThreshold && groupCount == o.groupCount;
        }
        bool operator!=(const CommonParameters& o) const { return !(*this == o); }
    };

    /**
     * @class Share
     * @brief A member fragment plus the metadata needed to recombine it.
     *
     * Thresholds and counts are stored with their real value (1..16); the
     * encoding subtracts one to fit them in 4 bits. Equality and hashing
     * cover every field, value included.
     */
    struct Share {
        uint16_t identifier = 0;
        uint8_t iterationExponent = 0;
        uint8_t groupIndex = 0;
        uint8_t groupThreshold = 1;
        uint8_t groupCount = 1;
        uint8_t memberIndex = 0;
        uint8_t memberThreshold = 1;
        SecureBytes value;

        CommonParameters commonParameters() const {
            return CommonParameters{identifier, iterationExponent, groupThreshold, groupCount};
        }

        /**
         * @brief Word indices of the share: header, value, then the 3 checksum words.
         * @throw InvalidParameters If a field does not fit its bit width.
         */
        std::vector<uint16_t> indices() const;

        /**
         * @brief Space-separated mnemonic.
         */
        std::string mnemonic(const Wordlist& wordlist) const;

        std::vector<std::string> words(const Wordlist& wordlist) const;

        /**
         * @brief First GROUP_PREFIX_LENGTH_WORDS words, identical for all members of a group.
         *
         * Only identifier, exponent and group fields feed these words, so
         * they identify a group without revealing any share value.
         */
        std::string groupPrefix(const Wordlist& wordlist) const;

        /**
         * @brief Parse a mnemonic.
         * @throw UnknownWord, InvalidWordCount, InvalidChecksum, InvalidPadding, InvalidShareHeader
         */
        static Share fromMnemonic(const Wordlist& wordlist, const std::string& mnemonic);

        /**
         * @brief Parse word indices, checksum included.
         * @throw InvalidWordCount, InvalidChecksum, InvalidPadding, InvalidShareHeader
         */
        static Share fromIndices(const std::vector<uint16_t>& indices);

        bool operator==(const Share& o) const;
        bool operator!=(const Share& o) const { return !(*this == o); }
    };

    struct ShareHash {
        std::size_t operator()(const Share& share) const noexcept;
    };

} // namespace Arkenstone

#endif // SHARE_HPP
