#ifndef RS1024_HPP
#define RS1024_HPP

#include <array>
#include <cstdint>
#include <vector>

#include "constants.hpp"
#include "exceptions.hpp"

/**
 * @file rs1024.hpp
 * @brief Reed-Solomon checksum over GF(1024) protecting a mnemonic.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @class RS1024
     * @brief Creates and verifies the three trailing checksum words of a share.
     *
     * Every sequence is implicitly prefixed with CUSTOMIZATION_STRING, one
     * symbol per character. A valid sequence has polymod residue 1. Any
     * substitution of up to three words is detected.
     */
    class RS1024 {
    public:
        using Checksum = std::array<uint16_t, CHECKSUM_LENGTH_WORDS>;

        /**
         * @brief Residue of the polynomial formed by the given 10-bit symbols.
         */
        static uint32_t polymod(const std::vector<uint16_t>& values);

        /**
         * @brief Checksum symbols to append to data.
         * @param data Header and value symbols, without checksum.
         */
        static Checksum createChecksum(const std::vector<uint16_t>& data);

        /**
         * @brief True if data, checksum included, has the expected residue.
         */
        static bool verifyChecksum(const std::vector<uint16_t>& data);

        /**
         * @brief Same as verifyChecksum but throws on failure.
         * @throw InvalidChecksum If the residue does not match.
         */
        static void requireValid(const std::vector<uint16_t>& data);
    };

} // namespace Arkenstone

#endif // RS1024_HPP
