// ==============================================================================
// Layer 1: DSP Primitive - StringLoop
// ==============================================================================
// Circular buffer forming the feedback loop of a plucked string. Sized once
// at construction (power-of-two length for bitwise wraparound); write() and
// the read methods never allocate.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Swapline {
namespace DSP {

/// @brief Compute next power of 2 greater than or equal to n.
inline constexpr std::size_t nextPowerOf2(std::size_t n) noexcept {
    if (n == 0) return 1;
    --n;
    n |= n >> 1;
    n |= n >> 2;
    n |= n >> 4;
    n |= n >> 8;
    n |= n >> 16;
    n |= n >> 32;
    return n + 1;
}

/// @brief Fixed-length delay loop with integer and linear-interpolated reads.
///
/// read(0) returns the most recently written sample, read(d) the sample
/// written d writes before it.
///
/// @code
/// StringLoop loop(200);          // up to 200 samples of delay
/// loop.write(x);
/// float y = loop.readLinear(99.5f);
/// @endcode
class StringLoop {
public:
    StringLoop() noexcept = default;

    /// Allocates storage for maxDelaySamples of history.
    explicit StringLoop(std::size_t maxDelaySamples)
        : buffer_(nextPowerOf2(maxDelaySamples + 2), 0.0f)
        , mask_(buffer_.size() - 1)
        , maxDelaySamples_(maxDelaySamples) {}

    // Non-copyable, movable
    StringLoop(const StringLoop&) = delete;
    StringLoop& operator=(const StringLoop&) = delete;
    StringLoop(StringLoop&&) noexcept = default;
    StringLoop& operator=(StringLoop&&) noexcept = default;

    /// Clear to silence without reallocating.
    void reset() noexcept {
        std::fill(buffer_.begin(), buffer_.end(), 0.0f);
        writeIndex_ = 0;
    }

    void write(float sample) noexcept {
        buffer_[writeIndex_] = sample;
        writeIndex_ = (writeIndex_ + 1) & mask_;
    }

    /// Integer delay read. Delay is clamped to [0, maxDelaySamples].
    [[nodiscard]] float read(std::size_t delaySamples) const noexcept {
        const std::size_t clampedDelay = std::min(delaySamples, maxDelaySamples_);
        return buffer_[(writeIndex_ - 1 - clampedDelay) & mask_];
    }

    /// Fractional delay read with linear interpolation.
    [[nodiscard]] float readLinear(float delaySamples) const noexcept {
        const float clampedDelay =
            std::clamp(delaySamples, 0.0f, static_cast<float>(maxDelaySamples_));
        const float intPart = std::floor(clampedDelay);
        const float frac = clampedDelay - intPart;

        const auto index0 = static_cast<std::size_t>(intPart);
        const std::size_t index1 = std::min(index0 + 1, maxDelaySamples_);

        const float y0 = read(index0);
        const float y1 = read(index1);
        return y0 + frac * (y1 - y0);
    }

    [[nodiscard]] std::size_t maxDelaySamples() const noexcept {
        return maxDelaySamples_;
    }

    [[nodiscard]] bool empty() const noexcept {
        return buffer_.empty();
    }

private:
    std::vector<float> buffer_;
    std::size_t mask_ = 0;
    std::size_t writeIndex_ = 0;
    std::size_t maxDelaySamples_ = 0;
};

} // namespace DSP
} // namespace Swapline
