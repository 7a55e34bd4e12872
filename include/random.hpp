#ifndef RANDOM_HPP
#define RANDOM_HPP

#include <cstddef>
#include <cstdint>

#include "exceptions.hpp"
#include "secure_string.hpp"

/**
 * @file random.hpp
 * @brief Cryptographically secure random bytes from the OpenSSL CSPRNG.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @brief Fill a buffer with random bytes.
     * @throw CryptoException If the CSPRNG fails.
     */
    void randomFill(uint8_t* out, std::size_t len);

    /**
     * @brief Fresh random bytes in zeroizing memory.
     * @throw CryptoException If the CSPRNG fails.
     */
    SecureBytes randomBytes(std::size_t len);

    /**
     * @brief Uniform random value in [0, 2^bits).
     */
    uint32_t randomBits(unsigned bits);

} // namespace Arkenstone

#endif // RANDOM_HPP
