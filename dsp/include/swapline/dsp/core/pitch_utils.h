// ==============================================================================
// Layer 0: Core Utility - Pitch Conversion
// ==============================================================================
// Symbolic notes (pitch class + octave) and their equal-tempered frequency.
//
// Octave 0 is the reference octave: it contains the 440 Hz anchor at pitch
// class A (index 9), so C0 is middle C (~261.626 Hz).
//
// Real-time safe: no allocation, no exceptions, no I/O.
// ==============================================================================

#pragma once

#include <cmath>
#include <cstdint>

namespace Swapline::DSP {

// =============================================================================
// Constants
// =============================================================================

/// Tuning anchor in Hz
inline constexpr double kReferenceFrequencyHz = 440.0;

/// Semitones per octave
inline constexpr int kSemitonesPerOctave = 12;

// =============================================================================
// Types
// =============================================================================

/// The twelve equal-tempered pitch classes, German spelling (H = B natural).
enum class PitchClass : uint8_t {
    C = 0,
    Cis,
    D,
    Dis,
    E,
    F,
    Fis,
    G,
    Gis,
    A,
    Ais,
    H
};

/// Number of pitch classes; valid indices are [0, kNumPitchClasses)
inline constexpr int kNumPitchClasses = 12;

/// Pitch class carrying the reference frequency
inline constexpr PitchClass kReferencePitchClass = PitchClass::A;

/// @brief Immutable note: pitch class plus signed octave.
struct Note {
    PitchClass pitchClass = PitchClass::C;
    int octave = 0;

    [[nodiscard]] constexpr bool operator==(const Note&) const noexcept = default;
};

// =============================================================================
// Functions
// =============================================================================

/// Semitone position relative to C0: pitchClass + 12 * octave.
/// Computed in 64 bits so every int octave has an exact index.
[[nodiscard]] constexpr int64_t semitoneIndex(Note note) noexcept {
    return static_cast<int64_t>(note.pitchClass) +
           static_cast<int64_t>(kSemitonesPerOctave) * static_cast<int64_t>(note.octave);
}

/// Convert a note to its equal-tempered frequency.
///
/// Formula: f = 440 * 2^((semitoneIndex - 9) / 12)
///
/// @example noteToFrequency({PitchClass::A, 0})  -> 440.0 Hz (exact)
/// @example noteToFrequency({PitchClass::C, 0})  -> 261.626 Hz
/// @example noteToFrequency({PitchClass::C, 1})  -> 523.251 Hz
[[nodiscard]] inline double noteToFrequency(Note note) noexcept {
    const int64_t offset = semitoneIndex(note) - static_cast<int64_t>(kReferencePitchClass);
    return kReferenceFrequencyHz *
           std::exp2(static_cast<double>(offset) / static_cast<double>(kSemitonesPerOctave));
}

/// Display name of a pitch class ("C", "Cis", ..., "H").
[[nodiscard]] constexpr const char* pitchClassName(PitchClass pc) noexcept {
    switch (pc) {
        case PitchClass::C:   return "C";
        case PitchClass::Cis: return "Cis";
        case PitchClass::D:   return "D";
        case PitchClass::Dis: return "Dis";
        case PitchClass::E:   return "E";
        case PitchClass::F:   return "F";
        case PitchClass::Fis: return "Fis";
        case PitchClass::G:   return "G";
        case PitchClass::Gis: return "Gis";
        case PitchClass::A:   return "A";
        case PitchClass::Ais: return "Ais";
        case PitchClass::H:   return "H";
    }
    return "?";
}

} // namespace Swapline::DSP
