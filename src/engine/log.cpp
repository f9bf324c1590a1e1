// ==============================================================================
// Player Logging Implementation
// ==============================================================================

#include "log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace Swapline {

namespace {

std::atomic<LogLevel> gLogLevel{LogLevel::Info};

const char* levelTag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error:   return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info:    return "info";
        case LogLevel::Debug:   return "debug";
    }
    return "log";
}

} // anonymous namespace

void setLogLevel(LogLevel level) noexcept {
    gLogLevel.store(level, std::memory_order_relaxed);
}

LogLevel logLevel() noexcept {
    return gLogLevel.load(std::memory_order_relaxed);
}

void logMessage(LogLevel level, const char* fmt, ...) {
    if (static_cast<uint8_t>(level) > static_cast<uint8_t>(logLevel())) {
        return;
    }

    char buf[512];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    std::fprintf(stderr, "swapline [%s] %s\n", levelTag(level), buf);
}

} // namespace Swapline
