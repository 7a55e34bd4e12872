#ifndef HEX_HPP
#define HEX_HPP

#include <string>

#include "exceptions.hpp"
#include "secure_string.hpp"

/**
 * @file hex.hpp
 * @brief Hexadecimal representation of master secrets.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @brief Lowercase hex string of the given bytes.
     */
    std::string hexEncode(const SecureBytes& bytes);

    /**
     * @brief Parse a hex string (either case).
     * @throw InvalidParameters If the length is odd or a character is not a hex digit.
     */
    SecureBytes hexDecode(const std::string& hex);

} // namespace Arkenstone

#endif // HEX_HPP
