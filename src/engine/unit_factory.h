#pragma once

// ==============================================================================
// Unit Factory
// ==============================================================================
// Builds the audio units the sequencer installs. Runs on the control thread;
// all allocation for a note happens here, before the unit is handed to the
// GraphHost.
// ==============================================================================

#include <swapline/dsp/processors/i_audio_unit.h>
#include <swapline/dsp/processors/plucked_string.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace Swapline {

enum class VoiceType : uint8_t {
    Pluck = 0,
    Sine
};

[[nodiscard]] const char* voiceTypeName(VoiceType type) noexcept;

struct VoiceSettings {
    VoiceType type = VoiceType::Pluck;
    DSP::PluckSettings pluck;
    float sineLevel = 0.5f;
};

class UnitFactory {
public:
    /// @throws std::invalid_argument if sampleRate is not positive
    UnitFactory(double sampleRate, const VoiceSettings& settings);

    /// One voice at the given frequency. Successive plucks get distinct noise
    /// seeds so repeated notes do not sound identical.
    [[nodiscard]] std::unique_ptr<DSP::IAudioUnit> makeVoice(float frequency);

    /// A single voice for one frequency, a ChordUnit for several.
    /// @throws std::invalid_argument if frequencies is empty
    [[nodiscard]] std::unique_ptr<DSP::IAudioUnit> makeUnit(const std::vector<float>& frequencies);

    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] const VoiceSettings& settings() const noexcept { return settings_; }

    /// Units built so far, counting chord voices and the chord itself
    [[nodiscard]] uint64_t unitsBuilt() const noexcept { return unitsBuilt_; }

private:
    double sampleRate_;
    VoiceSettings settings_;
    uint32_t nextSeed_;
    uint64_t unitsBuilt_ = 0;
};

} // namespace Swapline
