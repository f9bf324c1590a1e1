#pragma once
// ==============================================================================
// Test Audio Units
// ==============================================================================
// Deterministic IAudioUnit implementations for graph and driver tests.
// ==============================================================================

#include <swapline/dsp/processors/i_audio_unit.h>

#include <atomic>
#include <cstdint>

namespace TestHelpers {

/// Emits the same value on both channels forever.
class ConstantUnit final : public Swapline::DSP::IAudioUnit {
public:
    explicit ConstantUnit(float value, float frequency = 0.0f) noexcept
        : value_(value), frequency_(frequency) {}

    Swapline::DSP::StereoOutput nextSample() noexcept override { return {value_, value_}; }
    float frequency() const noexcept override { return frequency_; }
    const char* name() const noexcept override { return "constant"; }

private:
    float value_;
    float frequency_;
};

/// Emits id * kStep so each frame identifies the unit that produced it.
/// Optionally counts ticks and destructions through shared counters.
class TaggedUnit final : public Swapline::DSP::IAudioUnit {
public:
    static constexpr float kStep = 1.0f / 4096.0f;

    explicit TaggedUnit(uint32_t id, std::atomic<uint64_t>* ticks = nullptr,
                        std::atomic<int>* destroyed = nullptr) noexcept
        : id_(id), ticks_(ticks), destroyed_(destroyed) {}

    ~TaggedUnit() override {
        if (destroyed_ != nullptr) {
            destroyed_->fetch_add(1, std::memory_order_relaxed);
        }
    }

    Swapline::DSP::StereoOutput nextSample() noexcept override {
        if (ticks_ != nullptr) {
            ticks_->fetch_add(1, std::memory_order_relaxed);
        }
        const float v = static_cast<float>(id_) * kStep;
        return {v, v};
    }

    float frequency() const noexcept override { return static_cast<float>(id_); }
    const char* name() const noexcept override { return "tagged"; }

    uint32_t id() const noexcept { return id_; }

private:
    uint32_t id_;
    std::atomic<uint64_t>* ticks_;
    std::atomic<int>* destroyed_;
};

} // namespace TestHelpers
