#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#include <cstddef>
#include <cstdint>

/**
 * @file constants.hpp
 * @brief Protocol constants of the SLIP-0039 share format.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /// Bits carried by one mnemonic word.
    constexpr unsigned RADIX_BITS = 10;

    /// Number of words in the vocabulary.
    constexpr std::size_t RADIX = std::size_t(1) << RADIX_BITS;

    constexpr unsigned ID_LENGTH_BITS = 15;
    constexpr unsigned ITERATION_EXP_LENGTH_BITS = 5;

    /// Words holding the identifier and the iteration exponent.
    constexpr std::size_t ID_EXP_LENGTH_WORDS = 2;

    /// Words shared by every member of one group (identifier, exponent, group fields).
    constexpr std::size_t GROUP_PREFIX_LENGTH_WORDS = ID_EXP_LENGTH_WORDS + 1;

    constexpr std::size_t CHECKSUM_LENGTH_WORDS = 3;

    /// Header (4 words) plus checksum (3 words).
    constexpr std::size_t METADATA_LENGTH_WORDS = ID_EXP_LENGTH_WORDS + 2 + CHECKSUM_LENGTH_WORDS;

    constexpr std::size_t MIN_STRENGTH_BITS = 128;

    constexpr std::size_t MIN_MNEMONIC_LENGTH_WORDS =
        METADATA_LENGTH_WORDS + (MIN_STRENGTH_BITS + RADIX_BITS - 1) / RADIX_BITS;

    constexpr unsigned MAX_SHARE_COUNT = 16;

    constexpr std::size_t DIGEST_LENGTH_BYTES = 4;

    constexpr uint8_t DIGEST_INDEX = 254;
    constexpr uint8_t SECRET_INDEX = 255;

    /// Prefixed to the checksum input and to the cipher salt.
    constexpr char CUSTOMIZATION_STRING[] = "shamir";
    constexpr std::size_t CUSTOMIZATION_STRING_LENGTH = sizeof(CUSTOMIZATION_STRING) - 1;

    /// PBKDF2 iterations summed over all rounds at exponent 0.
    constexpr uint32_t BASE_ITERATION_COUNT = 10000;

    constexpr unsigned ROUND_COUNT = 4;

    constexpr unsigned MAX_ITERATION_EXPONENT = (1u << ITERATION_EXP_LENGTH_BITS) - 1;

    constexpr uint16_t MAX_IDENTIFIER = (1u << ID_LENGTH_BITS) - 1;

} // namespace Arkenstone

#endif // CONSTANTS_HPP
