// ==============================================================================
// Layer 1: DSP Primitive - StereoPanner
// ==============================================================================
// Fixed downstream stage of the graph: folds the incoming frame to mono and
// places it in the stereo field with an equal-power (sin/cos) law.
//
//   angle = (pan + 1) * pi / 4
//   left  = mono * cos(angle)
//   right = mono * sin(angle)
//
// pan = -1 is hard left, 0 centre (both channels at 1/sqrt(2)), +1 hard right.
// ==============================================================================

#pragma once

#include <swapline/dsp/core/math_constants.h>
#include <swapline/dsp/core/stereo_output.h>

#include <algorithm>
#include <cmath>

namespace Swapline::DSP {

inline constexpr float kMinPan = -1.0f;
inline constexpr float kMaxPan = 1.0f;

class StereoPanner {
public:
    StereoPanner() noexcept { setPan(0.0f); }
    explicit StereoPanner(float pan) noexcept { setPan(pan); }

    /// @param pan Position in [-1, 1], clamped
    void setPan(float pan) noexcept {
        pan_ = std::clamp(pan, kMinPan, kMaxPan);
        const float angle = (pan_ + 1.0f) * 0.5f * kHalfPi;
        leftGain_ = std::cos(angle);
        rightGain_ = std::sin(angle);
    }

    [[nodiscard]] float getPan() const noexcept { return pan_; }
    [[nodiscard]] float leftGain() const noexcept { return leftGain_; }
    [[nodiscard]] float rightGain() const noexcept { return rightGain_; }

    [[nodiscard]] StereoOutput process(StereoOutput in) const noexcept {
        const float mono = 0.5f * (in.left + in.right);
        return StereoOutput{mono * leftGain_, mono * rightGain_};
    }

private:
    float pan_ = 0.0f;
    float leftGain_ = 0.0f;
    float rightGain_ = 0.0f;
};

} // namespace Swapline::DSP
