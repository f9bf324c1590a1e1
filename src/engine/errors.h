#pragma once

// ==============================================================================
// Player Error Types
// ==============================================================================
// Startup failures are reported as exceptions and are fatal: main() logs the
// message and exits with a non-zero status. Nothing on the audio path throws.
// ==============================================================================

#include <stdexcept>
#include <string>

namespace Swapline {

/// Invalid command line option or schedule document.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/// Audio device or stream could not be acquired.
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace Swapline
