// ==============================================================================
// Layer 2: DSP Processor - SineTone
// ==============================================================================
// Steady sine at a fixed level. Phase is accumulated in double precision and
// wrapped to [0, 1) so long notes do not drift.
// ==============================================================================

#pragma once

#include <swapline/dsp/core/math_constants.h>
#include <swapline/dsp/processors/i_audio_unit.h>

#include <algorithm>
#include <cmath>

namespace Swapline::DSP {

class SineTone final : public IAudioUnit {
public:
    /// @param sampleRate Sample rate in Hz (must be > 0)
    /// @param frequency  Tone frequency in Hz, clamped to [0, Nyquist)
    /// @param level      Peak amplitude, clamped to [0, 1]
    SineTone(double sampleRate, float frequency, float level = 0.5f) noexcept
        : frequency_(std::clamp(frequency, 0.0f, static_cast<float>(sampleRate * 0.499)))
        , level_(std::clamp(level, 0.0f, 1.0f))
        , increment_(sampleRate > 0.0 ? static_cast<double>(frequency_) / sampleRate : 0.0) {}

    [[nodiscard]] StereoOutput nextSample() noexcept override {
        const auto sample =
            static_cast<float>(std::sin(2.0 * kPiDouble * phase_)) * level_;
        phase_ += increment_;
        if (phase_ >= 1.0) {
            phase_ -= 1.0;
        }
        return monoToStereo(sample);
    }

    [[nodiscard]] float frequency() const noexcept override { return frequency_; }
    [[nodiscard]] const char* name() const noexcept override { return "sine"; }

    [[nodiscard]] float level() const noexcept { return level_; }

private:
    float frequency_;
    float level_;
    double increment_;
    double phase_ = 0.0;
};

} // namespace Swapline::DSP
