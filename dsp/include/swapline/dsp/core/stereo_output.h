// ==============================================================================
// Layer 0: Core Utility - StereoOutput
// ==============================================================================
// Stereo sample pair returned by every audio unit tick and by
// GraphHost::pullFrame(). Shared here so all layers agree on one definition.
// ==============================================================================

#pragma once

namespace Swapline::DSP {

/// @brief Lightweight stereo sample pair.
///
/// Aggregate with no user-declared constructors; supports brace
/// initialization: `StereoOutput{0.5f, -0.5f}`.
struct StereoOutput {
    float left = 0.0f;   ///< Left channel sample
    float right = 0.0f;  ///< Right channel sample
};

/// Mono sample duplicated into both channels.
[[nodiscard]] constexpr StereoOutput monoToStereo(float sample) noexcept {
    return StereoOutput{sample, sample};
}

} // namespace Swapline::DSP
