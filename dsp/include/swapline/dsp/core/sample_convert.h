// ==============================================================================
// Layer 0: Core Utility - Output Sample Conversion
// ==============================================================================
// Converts internal float samples to the device sample representation.
//
// Every conversion clamps to [-1, 1] first, scales to the target range and
// rounds to nearest. Unsigned 8-bit output is offset binary around 128.
//
// Real-time safe: no allocation, no exceptions, no I/O.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace Swapline::DSP {

/// Sample representations a stream can be negotiated to.
enum class SampleFormat : uint8_t {
    Float32 = 0,
    Int32,
    Int16,
    Int8,
    UInt8
};

/// Short name used on the command line and in logs ("f32", "i16", ...).
[[nodiscard]] constexpr const char* sampleFormatName(SampleFormat format) noexcept {
    switch (format) {
        case SampleFormat::Float32: return "f32";
        case SampleFormat::Int32:   return "i32";
        case SampleFormat::Int16:   return "i16";
        case SampleFormat::Int8:    return "i8";
        case SampleFormat::UInt8:   return "u8";
    }
    return "?";
}

/// Bytes occupied by one sample of the given format.
[[nodiscard]] constexpr int bytesPerSample(SampleFormat format) noexcept {
    switch (format) {
        case SampleFormat::Float32: return 4;
        case SampleFormat::Int32:   return 4;
        case SampleFormat::Int16:   return 2;
        case SampleFormat::Int8:    return 1;
        case SampleFormat::UInt8:   return 1;
    }
    return 0;
}

namespace detail {

/// Clamp to [-1, 1]; NaN maps to 0 so a bad unit cannot produce full-scale noise.
[[nodiscard]] inline float clampUnit(float x) noexcept {
    if (std::isnan(x)) {
        return 0.0f;
    }
    return std::clamp(x, -1.0f, 1.0f);
}

template <typename IntT>
[[nodiscard]] inline IntT scaleSigned(float x) noexcept {
    constexpr double kScale = static_cast<double>(std::numeric_limits<IntT>::max());
    const double scaled = std::nearbyint(static_cast<double>(clampUnit(x)) * kScale);
    return static_cast<IntT>(scaled);
}

} // namespace detail

/// @brief Convert a float sample in [-1, 1] to the output type.
///
/// Supported: float, int32_t, int16_t, int8_t, uint8_t.
///
/// @example convertSample<int16_t>(1.0f)  -> 32767
/// @example convertSample<int16_t>(-2.0f) -> -32767 (clamped)
/// @example convertSample<uint8_t>(0.0f)  -> 128
template <typename SampleT>
[[nodiscard]] inline SampleT convertSample(float x) noexcept {
    if constexpr (std::is_same_v<SampleT, float>) {
        return detail::clampUnit(x);
    } else if constexpr (std::is_same_v<SampleT, uint8_t>) {
        const double scaled = std::nearbyint(static_cast<double>(detail::clampUnit(x)) * 127.0);
        return static_cast<uint8_t>(128 + static_cast<int>(scaled));
    } else {
        static_assert(std::is_same_v<SampleT, int32_t> || std::is_same_v<SampleT, int16_t> ||
                          std::is_same_v<SampleT, int8_t>,
                      "unsupported output sample type");
        return detail::scaleSigned<SampleT>(x);
    }
}

} // namespace Swapline::DSP
