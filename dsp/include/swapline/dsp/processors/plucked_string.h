// ==============================================================================
// Layer 2: DSP Processor - PluckedString
// ==============================================================================
// Karplus-Strong plucked string.
//
// At construction the string loop (one period long) is filled with a
// zero-mean noise burst. Every tick:
//
//   a = y[n - P']          b = y[n - P' - 1]
//   y[n] = g * ((1 - s) * a + s * b)
//
// where s = damping / 2 is the two-tap low-pass blend (it also contributes
// s samples of delay, so P' = sampleRate / frequency - s keeps the pitch in
// tune) and g = gainPerSecond^(1 / frequency) is the loop gain per period, so
// the amplitude falls by gainPerSecond every second before low-pass losses.
//
// All allocation happens in the constructor; nextSample() is real-time safe.
// ==============================================================================

#pragma once

#include <swapline/dsp/core/excitation_noise.h>
#include <swapline/dsp/primitives/string_loop.h>
#include <swapline/dsp/processors/i_audio_unit.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Swapline::DSP {

// =============================================================================
// Constants
// =============================================================================

/// Lowest playable string frequency in Hz
inline constexpr float kMinPluckFrequency = 20.0f;

/// Highest playable frequency as a fraction of the sample rate
inline constexpr float kMaxPluckFrequencyRatio = 0.45f;

// =============================================================================
// PluckSettings
// =============================================================================

/// Fixed synthesis parameters of a pluck.
struct PluckSettings {
    float gainPerSecond = 0.5f;  ///< Amplitude retained after one second, (0, 1]
    float damping = 0.9f;        ///< High-frequency damping, [0, 1]
    float excitation = 0.6f;     ///< Peak level of the initial noise burst, [0, 1]
    uint32_t seed = 1;           ///< Noise seed (0 selects the generator default)
};

// =============================================================================
// PluckedString
// =============================================================================

/// @brief Karplus-Strong string voice with mono output on both channels.
///
/// @par Example Usage
/// @code
/// auto unit = std::make_unique<PluckedString>(48000.0, 261.626f, PluckSettings{});
/// StereoOutput frame = unit->nextSample();
/// @endcode
class PluckedString final : public IAudioUnit {
public:
    PluckedString(double sampleRate, float frequency, const PluckSettings& settings = {})
        : frequency_(clampFrequency(sampleRate, frequency))
        , blend_(0.5f * std::clamp(settings.damping, 0.0f, 1.0f))
        , loopGain_(computeLoopGain(settings.gainPerSecond, frequency_))
        , period_(static_cast<float>(sampleRate / static_cast<double>(frequency_)))
        , loopDelay_(period_ - blend_)
        , loop_(static_cast<std::size_t>(std::ceil(period_)) + 1) {
        excite(std::clamp(settings.excitation, 0.0f, 1.0f), settings.seed);
    }

    [[nodiscard]] StereoOutput nextSample() noexcept override {
        // read(0) is y[n-1], so y[n-k] lives at delay k - 1
        const float a = loop_.readLinear(loopDelay_ - 1.0f);
        const float b = loop_.readLinear(loopDelay_);
        const float y = loopGain_ * ((1.0f - blend_) * a + blend_ * b);
        loop_.write(y);
        return monoToStereo(y);
    }

    [[nodiscard]] float frequency() const noexcept override { return frequency_; }
    [[nodiscard]] const char* name() const noexcept override { return "pluck"; }

    /// Loop length in samples (sampleRate / frequency)
    [[nodiscard]] float periodSamples() const noexcept { return period_; }

    /// Gain applied once per trip around the loop
    [[nodiscard]] float loopGain() const noexcept { return loopGain_; }

private:
    [[nodiscard]] static float clampFrequency(double sampleRate, float frequency) noexcept {
        const float maxFrequency = static_cast<float>(sampleRate) * kMaxPluckFrequencyRatio;
        return std::clamp(frequency, kMinPluckFrequency, std::max(kMinPluckFrequency, maxFrequency));
    }

    [[nodiscard]] static float computeLoopGain(float gainPerSecond, float frequency) noexcept {
        const float g = std::clamp(gainPerSecond, 1e-6f, 1.0f);
        return std::pow(g, 1.0f / frequency);
    }

    /// Fill one period plus the interpolation tap with zero-mean noise.
    void excite(float level, uint32_t seed) noexcept {
        generateZeroMeanBurst(loop_.maxDelaySamples() + 1, level, seed,
                              [this](float sample) { loop_.write(sample); });
    }

    float frequency_;
    float blend_;
    float loopGain_;
    float period_;
    float loopDelay_;
    StringLoop loop_;
};

} // namespace Swapline::DSP
