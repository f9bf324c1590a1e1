// ==============================================================================
// Layer 2: DSP Processor - SilenceUnit
// ==============================================================================
// Unit that outputs zeros. Occupies the replaceable slot until the first
// install so the audio thread always has a valid unit to tick.
// ==============================================================================

#pragma once

#include <swapline/dsp/processors/i_audio_unit.h>

namespace Swapline::DSP {

class SilenceUnit final : public IAudioUnit {
public:
    [[nodiscard]] StereoOutput nextSample() noexcept override { return {}; }
    [[nodiscard]] float frequency() const noexcept override { return 0.0f; }
    [[nodiscard]] const char* name() const noexcept override { return "silence"; }
};

} // namespace Swapline::DSP
