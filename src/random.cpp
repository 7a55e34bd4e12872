#include "../include/random.hpp"

#include <openssl/rand.h>

#include <climits>

/**
 * @file random.cpp
 * @brief OpenSSL-backed random source.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    void randomFill(uint8_t* out, std::size_t len) {
        while (len > 0) {
            const int chunk = len > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
            if (RAND_bytes(out, chunk) != 1)
                throw CryptoException("CSPRNG random generation failed.");
            out += chunk;
            len -= static_cast<std::size_t>(chunk);
        }
    }

    SecureBytes randomBytes(std::size_t len) {
        SecureBytes bytes(len);
        randomFill(bytes.data(), bytes.size());
        return bytes;
    }

    uint32_t randomBits(unsigned bits) {
        uint8_t buf[4];
        randomFill(buf, sizeof(buf));
        const uint32_t value = (uint32_t(buf[0]) << 24) | (uint32_t(buf[1]) << 16) |
                               (uint32_t(buf[2]) << 8) | uint32_t(buf[3]);
        secure_memzero(buf, sizeof(buf));
        return bits >= 32 ? value : value & ((uint32_t(1) << bits) - 1);
    }

} // namespace Arkenstone
