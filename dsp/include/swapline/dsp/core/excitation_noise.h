// ==============================================================================
// Layer 0: Core Utilities
// excitation_noise.h - Seeded noise for string excitation
// ==============================================================================
// Deterministic per seed so a note can be reproduced exactly in tests.
// No allocation; callers supply the destination.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>

namespace Swapline {
namespace DSP {

/// @brief Uniform white noise from a 32-bit xorshift (shifts 13, 17, 5).
///
/// Period 2^32-1. Not suitable for anything but audio.
class NoiseSource {
public:
    /// Seed 0 would lock the generator at zero; it selects kFallbackSeed.
    static constexpr uint32_t kFallbackSeed = 2463534242u;

    explicit constexpr NoiseSource(uint32_t seed = 1) noexcept
        : state_(seed != 0 ? seed : kFallbackSeed) {}

    constexpr void reseed(uint32_t seed) noexcept {
        state_ = seed != 0 ? seed : kFallbackSeed;
    }

    /// Next raw word, never 0.
    [[nodiscard]] constexpr uint32_t nextWord() noexcept {
        uint32_t x = state_;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state_ = x;
        return x;
    }

    /// Next sample in [-1, 1].
    [[nodiscard]] constexpr float nextBipolar() noexcept {
        return static_cast<float>(static_cast<double>(nextWord()) * kWordToUnit * 2.0 - 1.0);
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept { return state_; }

private:
    static constexpr double kWordToUnit = 1.0 / 4294967295.0;

    uint32_t state_;
};

/// @brief Emit a burst of noise with its DC offset removed.
///
/// Draws the sequence twice from the same seed: once to measure the mean,
/// once to emit (sample - mean) * level through sink(float).
template <typename Sink>
void generateZeroMeanBurst(std::size_t length, float level, uint32_t seed, Sink&& sink) noexcept {
    if (length == 0) {
        return;
    }

    NoiseSource noise(seed);
    double sum = 0.0;
    for (std::size_t i = 0; i < length; ++i) {
        sum += static_cast<double>(noise.nextBipolar());
    }
    const auto mean = static_cast<float>(sum / static_cast<double>(length));

    noise.reseed(seed);
    for (std::size_t i = 0; i < length; ++i) {
        sink(level * (noise.nextBipolar() - mean));
    }
}

} // namespace DSP
} // namespace Swapline
