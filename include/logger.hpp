#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <mutex>
#include <string>
#include <utility>
#include <vector>

/**
 * @file logger.hpp
 * @brief JSON-lines event logger writing to std::clog.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    /**
     * @class Logger
     * @brief Process-wide event log, disabled until a front end enables it.
     *
     * Only event names and non-secret metadata may be logged: never
     * share values, mnemonics, passphrases or master secrets.
     */
    class Logger {
    public:
        enum class Level {
            Info,
            Warning,
            Error
        };

        using Field = std::pair<std::string, std::string>;
        using FieldList = std::vector<Field>;

        static Logger& instance();

        void log(Level level, const std::string& event, const FieldList& fields = {});

        void setEnabled(bool enabled);
        bool enabled() const;

    private:
        Logger() = default;

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static const char* levelToString(Level level);
        static std::string escapeJson(const std::string& value);

        bool enabled_{false};
        mutable std::mutex mutex_;
    };

} // namespace Arkenstone

#endif // LOGGER_HPP
