#include "../include/gf256.hpp"

/**
 * @file gf256.cpp
 * @brief GF(256) table construction and multiplication/division.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    GF256::GF256() {
        uint16_t poly = 1;
        for (unsigned i = 0; i < 255; ++i) {
            exp_[i] = static_cast<uint8_t>(poly);
            log_[poly] = static_cast<uint8_t>(i);

            // Multiply by the generator 3 = x + 1
            poly = static_cast<uint16_t>((poly << 1) ^ poly);
            if (poly & 0x100) {
                poly ^= REDUCTION_POLYNOMIAL;
            }
        }
    }

    uint8_t GF256::mul(uint8_t a, uint8_t b) const {
        if (a == 0 || b == 0) {
            return 0;
        }
        return exp_[(static_cast<unsigned>(log_[a]) + log_[b]) % 255];
    }

    uint8_t GF256::div(uint8_t a, uint8_t b) const {
        if (b == 0) {
            throw DivisionByZero("Division by zero in GF(256)");
        }
        if (a == 0) {
            return 0;
        }
        return exp_[(static_cast<unsigned>(log_[a]) + 255 - log_[b]) % 255];
    }

} // namespace Arkenstone
