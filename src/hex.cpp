#include "../include/hex.hpp"

/**
 * @file hex.cpp
 * @brief Hex encoding helpers.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    namespace {

        int nibble(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    }

    std::string hexEncode(const SecureBytes& bytes) {
        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(bytes.size() * 2);
        for (uint8_t b : bytes) {
            out.push_back(digits[b >> 4]);
            out.push_back(digits[b & 0x0F]);
        }
        return out;
    }

    SecureBytes hexDecode(const std::string& hex) {
        if (hex.size() % 2 != 0)
            throw InvalidParameters("Secret bytes must be hex encoded");

        SecureBytes out;
        out.reserve(hex.size() / 2);
        for (std::size_t i = 0; i < hex.size(); i += 2) {
            const int hi = nibble(hex[i]);
            const int lo = nibble(hex[i + 1]);
            if (hi < 0 || lo < 0)
                throw InvalidParameters("Secret bytes must be hex encoded");
            out.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }
        return out;
    }

} // namespace Arkenstone
