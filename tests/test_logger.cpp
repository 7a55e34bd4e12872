/**
 * @file test_logger.cpp
 * @brief Unit tests for Arkenstone::Logger using Catch2.
 * @author Arkenstone Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/logger.hpp"

#include <iostream>
#include <sstream>
#include <string>

using namespace Arkenstone;

/**
 * @brief Captures std::clog for the lifetime of the object.
 */
class ClogCapture {
public:
    ClogCapture() : saved_(std::clog.rdbuf(buffer_.rdbuf())) {}
    ~ClogCapture() { std::clog.rdbuf(saved_); }

    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* saved_;
};

TEST_CASE("Logger is silent until enabled", "[Logger]") {
    Logger& logger = Logger::instance();
    REQUIRE_FALSE(logger.enabled());

    ClogCapture capture;
    logger.log(Logger::Level::Info, "split_generated", {{"group_count", "2"}});
    REQUIRE(capture.str().empty());
}

TEST_CASE("Logger writes one JSON object per event", "[Logger]") {
    Logger& logger = Logger::instance();
    logger.setEnabled(true);
    REQUIRE(logger.enabled());

    ClogCapture capture;
    logger.log(Logger::Level::Warning, "share_rejected", {{"reason", "InvalidChecksum"}, {"note", "a\"b\n"}});
    logger.setEnabled(false);

    const std::string line = capture.str();
    REQUIRE(line.front() == '{');
    REQUIRE(line.back() == '\n');
    REQUIRE(line.find("\"level\":\"warning\"") != std::string::npos);
    REQUIRE(line.find("\"event\":\"share_rejected\"") != std::string::npos);
    REQUIRE(line.find("\"reason\":\"InvalidChecksum\"") != std::string::npos);
    REQUIRE(line.find("\"note\":\"a\\\"b\\n\"") != std::string::npos);
    REQUIRE(line.find('\n') == line.size() - 1);
}
