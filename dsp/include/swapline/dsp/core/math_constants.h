// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Mathematical constants shared by the oscillators and the panner.
//
// Constants are inline constexpr so every translation unit sees a single
// definition.
// ==============================================================================

#pragma once

namespace Swapline {
namespace DSP {

/// Pi in single precision
inline constexpr float kPi = 3.14159265358979323846f;

/// Quarter circle in radians (equal-power pan law spans [0, kHalfPi])
inline constexpr float kHalfPi = kPi / 2.0f;

/// Pi in double precision for phase accumulators that must not drift
inline constexpr double kPiDouble = 3.14159265358979323846;

} // namespace DSP
} // namespace Swapline
