#include "../include/console.hpp"

#include <iostream>
#include <utility>

#ifndef _WIN32
#include <termios.h>
#include <unistd.h>
#endif

/**
 * @file console.cpp
 * @brief Option parsing and terminal input for the command-line front end.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    namespace {

        /**
         * @brief Turns terminal echo off for its lifetime.
         */
        class EchoGuard {
        public:
            explicit EchoGuard(bool active) {
#ifndef _WIN32
                active_ = active && isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved_) == 0;
                if (active_) {
                    termios silent = saved_;
                    silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
                    tcsetattr(STDIN_FILENO, TCSANOW, &silent);
                }
#else
                (void)active;
#endif
            }

            ~EchoGuard() {
#ifndef _WIN32
                if (active_) tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
#endif
            }

            bool active() const { return active_; }

            EchoGuard(const EchoGuard&) = delete;
            EchoGuard& operator=(const EchoGuard&) = delete;

        private:
            bool active_ = false;
#ifndef _WIN32
            termios saved_{};
#endif
        };
    }

    int parseInt(const std::string& value, const std::string& option) {
        std::size_t pos = 0;
        int n = 0;
        try {
            n = std::stoi(value, &pos);
        } catch (const std::logic_error&) {
            throw UsageError("Invalid value for " + option + ": " + value);
        }
        if (pos != value.size())
            throw UsageError("Invalid value for " + option + ": " + value);
        return n;
    }

    uint8_t parseSmall(const std::string& value, const std::string& option) {
        const int n = parseInt(value, option);
        if (n < 0 || n > 255)
            throw UsageError("Value out of range for " + option + ": " + value);
        return static_cast<uint8_t>(n);
    }

    std::size_t parseBitCount(const std::string& value, const std::string& option) {
        const int n = parseInt(value, option);
        if (n <= 0)
            throw UsageError("Value must be positive for " + option + ": " + value);
        return static_cast<std::size_t>(n);
    }

    std::optional<secure_string> readSecretLine(std::istream& in, std::ostream& out,
                                                const std::string& prompt, bool hide) {
        out << prompt << std::flush;

        std::string line;
        bool ok = false;
        {
            EchoGuard guard(hide && &in == &std::cin);
            ok = static_cast<bool>(std::getline(in, line));
            if (guard.active()) out << "\n";
        }

        if (!ok) {
            secure_memzero(&line[0], line.size());
            return std::nullopt;
        }

        secure_string result(line);
        secure_memzero(&line[0], line.size());
        return std::optional<secure_string>(std::move(result));
    }

    std::optional<secure_string> promptPassphrase(std::istream& in, std::ostream& out, bool hide) {
        while (true) {
            std::optional<secure_string> first = readSecretLine(in, out, "Enter passphrase: ", hide);
            if (!first) return std::nullopt;
            std::optional<secure_string> second = readSecretLine(in, out, "Repeat for confirmation: ", hide);
            if (!second) return std::nullopt;

            if (!(*first == *second)) {
                out << "Error: The two entered values do not match.\n";
                continue;
            }
            if (!first->isPrintableAscii()) {
                out << "Passphrase must be ASCII. Please try again.\n";
                continue;
            }
            return first;
        }
    }

} // namespace Arkenstone
