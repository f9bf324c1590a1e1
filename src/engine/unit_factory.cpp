// ==============================================================================
// Unit Factory Implementation
// ==============================================================================

#include "unit_factory.h"

#include <swapline/dsp/processors/chord_unit.h>
#include <swapline/dsp/processors/sine_tone.h>

#include <stdexcept>
#include <utility>

namespace Swapline {

const char* voiceTypeName(VoiceType type) noexcept {
    switch (type) {
        case VoiceType::Pluck: return "pluck";
        case VoiceType::Sine: return "sine";
    }
    return "unknown";
}

UnitFactory::UnitFactory(double sampleRate, const VoiceSettings& settings)
    : sampleRate_(sampleRate)
    , settings_(settings)
    , nextSeed_(settings.pluck.seed == 0 ? 1u : settings.pluck.seed) {
    if (!(sampleRate > 0.0)) {
        throw std::invalid_argument("UnitFactory sample rate must be > 0");
    }
}

std::unique_ptr<DSP::IAudioUnit> UnitFactory::makeVoice(float frequency) {
    ++unitsBuilt_;
    if (settings_.type == VoiceType::Sine) {
        return std::make_unique<DSP::SineTone>(sampleRate_, frequency, settings_.sineLevel);
    }

    DSP::PluckSettings pluck = settings_.pluck;
    pluck.seed = nextSeed_;
    // Skip zero, which the noise generator replaces with its default seed
    nextSeed_ = nextSeed_ * 1664525u + 1013904223u;
    if (nextSeed_ == 0) {
        nextSeed_ = 1;
    }
    return std::make_unique<DSP::PluckedString>(sampleRate_, frequency, pluck);
}

std::unique_ptr<DSP::IAudioUnit> UnitFactory::makeUnit(const std::vector<float>& frequencies) {
    if (frequencies.empty()) {
        throw std::invalid_argument("UnitFactory::makeUnit: no frequencies");
    }
    if (frequencies.size() == 1) {
        return makeVoice(frequencies.front());
    }

    std::vector<std::unique_ptr<DSP::IAudioUnit>> voices;
    voices.reserve(frequencies.size());
    for (float f : frequencies) {
        voices.push_back(makeVoice(f));
    }
    ++unitsBuilt_;
    return std::make_unique<DSP::ChordUnit>(std::move(voices));
}

} // namespace Swapline
