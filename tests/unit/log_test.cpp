// ==============================================================================
// Logging Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "engine/log.h"

#include <string>

using namespace Swapline;

TEST_CASE("log level threshold round-trips", "[log]") {
    const LogLevel saved = logLevel();

    setLogLevel(LogLevel::Debug);
    REQUIRE(logLevel() == LogLevel::Debug);
    SWAPLINE_LOG_DEBUG("debug message %d", 1);

    setLogLevel(LogLevel::Error);
    REQUIRE(logLevel() == LogLevel::Error);
    // Below the threshold: discarded
    SWAPLINE_LOG_INFO("suppressed %s", "message");

    setLogLevel(saved);
    REQUIRE(logLevel() == saved);
}

TEST_CASE("long log messages are truncated, not overrun", "[log]") {
    const LogLevel saved = logLevel();
    setLogLevel(LogLevel::Warning);
    const std::string longText(4096, 'x');
    SWAPLINE_LOG_WARNING("%s", longText.c_str());
    setLogLevel(saved);
    SUCCEED();
}
