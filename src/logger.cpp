#include "../include/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

/**
 * @file logger.cpp
 * @brief Logger implementation.
 * @author Arkenstone Project
 * @date 2026
 */

namespace Arkenstone {

    namespace {

        std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t t = std::chrono::system_clock::to_time_t(now);
            std::tm tm{};
#if defined(_WIN32) || defined(_WIN64)
            gmtime_s(&tm, &t);
#else
            gmtime_r(&t, &tm);
#endif
            std::ostringstream oss;
            oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
            return oss.str();
        }
    }

    Logger& Logger::instance() {
        static Logger logger;
        return logger;
    }

    void Logger::log(Level level, const std::string& event, const FieldList& fields) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_) {
            return;
        }

        std::ostringstream oss;
        oss << "{\"ts\":\"" << timestamp() << "\","
            << "\"level\":\"" << levelToString(level) << "\","
            << "\"event\":\"" << escapeJson(event) << "\"";

        if (!fields.empty()) {
            oss << ",\"fields\":{";
            for (std::size_t i = 0; i < fields.size(); ++i) {
                oss << "\"" << escapeJson(fields[i].first) << "\":\"" << escapeJson(fields[i].second) << "\"";
                if (i + 1 < fields.size()) {
                    oss << ',';
                }
            }
            oss << '}';
        }

        oss << "}\n";
        std::clog << oss.str();
        std::clog.flush();
    }

    void Logger::setEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_ = enabled;
    }

    bool Logger::enabled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return enabled_;
    }

    const char* Logger::levelToString(Level level) {
        switch (level) {
            case Level::Info:
                return "info";
            case Level::Warning:
                return "warning";
            case Level::Error:
                return "error";
        }
        return "info";
    }

    std::string Logger::escapeJson(const std::string& value) {
        std::string escaped;
        escaped.reserve(value.size());
        for (const unsigned char ch : value) {
            switch (ch) {
                case '"':
                    escaped.append("\\\"");
                    break;
                case '\\':
                    escaped.append("\\\\");
                    break;
                case '\n':
                    escaped.append("\\n");
                    break;
                case '\r':
                    escaped.append("\\r");
                    break;
                case '\t':
                    escaped.append("\\t");
                    break;
                default:
                    if (ch < 0x20) {
                        std::ostringstream oss;
                        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(ch);
                        escaped.append(oss.str());
                    } else {
                        escaped.push_back(static_cast<char>(ch));
                    }
                    break;
            }
        }
        return escaped;
    }

} // namespace Arkenstone
