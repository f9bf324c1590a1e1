// ==============================================================================
// Layer 0: Core Utility - Tempo and Note Durations
// ==============================================================================
// Converts musical durations (beats at a tempo) into wall-clock time for the
// sequencer.
// ==============================================================================

#pragma once

#include <algorithm>

namespace Swapline {
namespace DSP {

/// @brief Minimum tempo in BPM (prevents division issues).
inline constexpr double kMinTempoBPM = 20.0;

/// @brief Maximum tempo in BPM (reasonable musical limit).
inline constexpr double kMaxTempoBPM = 300.0;

/// @brief Milliseconds per minute
inline constexpr double kMsPerMinute = 60000.0;

/// @brief Longest duration beatsToMilliseconds() returns (24 hours).
inline constexpr double kMaxNoteDurationMs = 24.0 * 60.0 * kMsPerMinute;

/// @brief Clamp a tempo to [kMinTempoBPM, kMaxTempoBPM].
[[nodiscard]] constexpr double clampTempo(double bpm) noexcept {
    return std::clamp(bpm, kMinTempoBPM, kMaxTempoBPM);
}

/// @brief Duration of a number of beats in milliseconds.
///
/// duration = beats * 60000 / bpm. The tempo is clamped first and the result
/// is clamped to [0, kMaxNoteDurationMs]; NaN beats give 0.
///
/// @example beatsToMilliseconds(1.0, 160.0) -> 375.0
/// @example beatsToMilliseconds(4.0, 160.0) -> 1500.0
[[nodiscard]] constexpr double beatsToMilliseconds(double beats, double bpm) noexcept {
    if (!(beats > 0.0)) {
        return 0.0;
    }
    return std::min(beats * kMsPerMinute / clampTempo(bpm), kMaxNoteDurationMs);
}

} // namespace DSP
} // namespace Swapline
