#include "../include/rs1024.hpp"

/**
 * @file rs1024.cpp
 * @brief RS1024 checksum generation and verification.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    namespace {

        constexpr std::array<uint32_t, 10> GENERATOR = {
            0xE0E040,
            0x1C1C080,
            0x3838100,
            0x7070200,
            0xE0E0009,
            0x1C0C2412,
            0x38086C24,
            0x3090FC48,
            0x21B1F890,
            0x3F3F120,
        };

        /**
         * @brief Customization string as symbols, followed by values.
         */
        std::vector<uint16_t> withCustomization(const std::vector<uint16_t>& values) {
            std::vector<uint16_t> out;
            out.reserve(CUSTOMIZATION_STRING_LENGTH + values.size() + CHECKSUM_LENGTH_WORDS);
            for (std::size_t i = 0; i < CUSTOMIZATION_STRING_LENGTH; ++i) {
                out.push_back(static_cast<uint8_t>(CUSTOMIZATION_STRING[i]));
            }
            out.insert(out.end(), values.begin(), values.end());
            return out;
        }
    }

    uint32_t RS1024::polymod(const std::vector<uint16_t>& values) {
        uint32_t chk = 1;
        for (uint16_t v : values) {
            const uint32_t b = chk >> 20;
            chk = ((chk & 0xFFFFF) << 10) ^ v;
            for (unsigned i = 0; i < GENERATOR.size(); ++i) {
                if ((b >> i) & 1) {
                    chk ^= GENERATOR[i];
                }
            }
        }
        return chk;
    }

    RS1024::Checksum RS1024::createChecksum(const std::vector<uint16_t>& data) {
        std::vector<uint16_t> values = withCustomization(data);
        values.insert(values.end(), CHECKSUM_LENGTH_WORDS, 0);

        const uint32_t residue = polymod(values) ^ 1;

        Checksum checksum{};
        for (std::size_t i = 0; i < CHECKSUM_LENGTH_WORDS; ++i) {
            const unsigned shift = static_cast<unsigned>(RADIX_BITS * (CHECKSUM_LENGTH_WORDS - 1 - i));
            checksum[i] = static_cast<uint16_t>((residue >> shift) & (RADIX - 1));
        }
        return checksum;
    }

    bool RS1024::verifyChecksum(const std::vector<uint16_t>& data) {
        return polymod(withCustomization(data)) == 1;
    }

    void RS1024::requireValid(const std::vector<uint16_t>& data) {
        if (!verifyChecksum(data)) {
            throw InvalidChecksum("Invalid mnemonic checksum");
        }
    }

} // namespace Arkenstone
