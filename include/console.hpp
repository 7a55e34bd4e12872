#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

#include "secure_string.hpp"

/**
 * @file console.hpp
 * @brief Option parsing and terminal input for the command-line front end.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @class UsageError
     * @brief Bad command line. The front end prints the message and exits 2.
     */
    class UsageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Parse a whole decimal integer option value.
     * @throw UsageError If value is not an integer.
     */
    int parseInt(const std::string& value, const std::string& option);

    /**
     * @brief Parse an option value in 0..255.
     * @throw UsageError If value is not an integer or out of range.
     */
    uint8_t parseSmall(const std::string& value, const std::string& option);

    /**
     * @brief Parse a strictly positive bit count.
     * @throw UsageError If value is not a positive integer.
     */
    std::size_t parseBitCount(const std::string& value, const std::string& option);

    /**
     * @brief Read one line, with terminal echo off when hide is set and in is a terminal.
     * @return std::nullopt if the stream ends or fails before a line is read.
     */
    std::optional<secure_string> readSecretLine(std::istream& in, std::ostream& out,
                                                const std::string& prompt, bool hide);

    /**
     * @brief Ask for a passphrase twice until both entries match and are printable ASCII.
     * @return std::nullopt if the input ends before a passphrase is confirmed.
     */
    std::optional<secure_string> promptPassphrase(std::istream& in, std::ostream& out, bool hide);

} // namespace Arkenstone

#endif // CONSOLE_HPP
