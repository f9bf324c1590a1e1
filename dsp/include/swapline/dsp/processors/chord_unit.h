// ==============================================================================
// Layer 2: DSP Processor - ChordUnit
// ==============================================================================
// Sums several voices so a chord can occupy the single replaceable slot.
// The voice list is fixed at construction; the output is scaled by 1/N to
// keep the sum inside [-1, 1] when every voice is.
// ==============================================================================

#pragma once

#include <swapline/dsp/processors/i_audio_unit.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Swapline::DSP {

class ChordUnit final : public IAudioUnit {
public:
    /// @param voices Non-empty list of non-null voices; ownership is taken
    /// @throws std::invalid_argument if the list is empty or holds a null voice
    explicit ChordUnit(std::vector<std::unique_ptr<IAudioUnit>> voices)
        : voices_(std::move(voices)) {
        if (voices_.empty()) {
            throw std::invalid_argument("ChordUnit needs at least one voice");
        }
        for (const auto& voice : voices_) {
            if (!voice) {
                throw std::invalid_argument("ChordUnit voice is null");
            }
        }
        scale_ = 1.0f / static_cast<float>(voices_.size());
    }

    [[nodiscard]] StereoOutput nextSample() noexcept override {
        StereoOutput sum;
        for (auto& voice : voices_) {
            const StereoOutput s = voice->nextSample();
            sum.left += s.left;
            sum.right += s.right;
        }
        return StereoOutput{sum.left * scale_, sum.right * scale_};
    }

    /// Root frequency (the first voice)
    [[nodiscard]] float frequency() const noexcept override {
        return voices_.front()->frequency();
    }

    [[nodiscard]] const char* name() const noexcept override { return "chord"; }

    [[nodiscard]] std::size_t voiceCount() const noexcept { return voices_.size(); }

    [[nodiscard]] const IAudioUnit& voice(std::size_t index) const { return *voices_.at(index); }

private:
    std::vector<std::unique_ptr<IAudioUnit>> voices_;
    float scale_ = 1.0f;
};

} // namespace Swapline::DSP
