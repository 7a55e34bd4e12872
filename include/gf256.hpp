#ifndef GF256_HPP
#define GF256_HPP

#include <array>
#include <cstdint>

#include "exceptions.hpp"

/**
 * @file gf256.hpp
 * @brief Arithmetic in GF(2^8) with the AES reduction polynomial.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @class GF256
     * @brief Log/exp tables of GF(256) built once from the generator 3.
     *
     * An instance is immutable after construction. The Shamir engine holds
     * it by reference, so build one per process and share it.
     */
    class GF256 {
    public:
        /// x^8 + x^4 + x^3 + x + 1
        static constexpr uint16_t REDUCTION_POLYNOMIAL = 0x11B;

        GF256();

        static uint8_t add(uint8_t a, uint8_t b) { return static_cast<uint8_t>(a ^ b); }

        /**
         * @brief Product of a and b. Zero if either operand is zero.
         */
        uint8_t mul(uint8_t a, uint8_t b) const;

        /**
         * @brief Quotient a / b.
         * @throw DivisionByZero If b is zero.
         */
        uint8_t div(uint8_t a, uint8_t b) const;

        /**
         * @brief Discrete logarithm base 3. log(0) is defined as 0.
         */
        uint8_t log(uint8_t a) const { return log_[a]; }

        /**
         * @brief 3^(e mod 255).
         */
        uint8_t exp(unsigned e) const { return exp_[e % 255]; }

    private:
        std::array<uint8_t, 255> exp_{};
        std::array<uint8_t, 256> log_{};
    };

} // namespace Arkenstone

#endif // GF256_HPP
