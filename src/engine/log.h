#pragma once

// ==============================================================================
// Player Logging
// ==============================================================================
// printf-style diagnostics to stderr with a level threshold.
//
// Control thread and startup only: these calls format into a stack buffer
// and write to stderr, which may block. Never call them from the audio
// callback.
// ==============================================================================

#include <cstdint>

namespace Swapline {

enum class LogLevel : uint8_t {
    Error = 0,
    Warning,
    Info,
    Debug
};

/// Messages above this level are discarded (default: Info).
void setLogLevel(LogLevel level) noexcept;
[[nodiscard]] LogLevel logLevel() noexcept;

#if defined(__GNUC__) || defined(__clang__)
#define SWAPLINE_PRINTF_FORMAT(fmtIndex, argIndex) __attribute__((format(printf, fmtIndex, argIndex)))
#else
#define SWAPLINE_PRINTF_FORMAT(fmtIndex, argIndex)
#endif

void logMessage(LogLevel level, const char* fmt, ...) SWAPLINE_PRINTF_FORMAT(2, 3);

#define SWAPLINE_LOG_ERROR(...) ::Swapline::logMessage(::Swapline::LogLevel::Error, __VA_ARGS__)
#define SWAPLINE_LOG_WARNING(...) ::Swapline::logMessage(::Swapline::LogLevel::Warning, __VA_ARGS__)
#define SWAPLINE_LOG_INFO(...) ::Swapline::logMessage(::Swapline::LogLevel::Info, __VA_ARGS__)
#define SWAPLINE_LOG_DEBUG(...) ::Swapline::logMessage(::Swapline::LogLevel::Debug, __VA_ARGS__)

} // namespace Swapline
