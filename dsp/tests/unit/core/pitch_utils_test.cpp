// Layer 0: Core Utility Tests - Note to Frequency

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <swapline/dsp/core/pitch_utils.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

using namespace Swapline::DSP;
using Catch::Approx;

// =============================================================================
// Reference Pitches
// =============================================================================

TEST_CASE("noteToFrequency hits the reference pitches", "[core][pitch][layer0]") {

    SECTION("A0 is exactly 440 Hz") {
        REQUIRE(noteToFrequency({PitchClass::A, 0}) == 440.0);
    }

    SECTION("C0 is middle C (~261.626 Hz)") {
        REQUIRE(noteToFrequency({PitchClass::C, 0}) == Approx(261.626).margin(0.01));
    }

    SECTION("E0 is ~329.628 Hz") {
        REQUIRE(noteToFrequency({PitchClass::E, 0}) == Approx(329.628).margin(0.01));
    }

    SECTION("C1 is ~523.251 Hz") {
        REQUIRE(noteToFrequency({PitchClass::C, 1}) == Approx(523.251).margin(0.01));
    }

    SECTION("H-1 is ~246.942 Hz") {
        REQUIRE(noteToFrequency({PitchClass::H, -1}) == Approx(246.942).margin(0.01));
    }
}

// =============================================================================
// Formula
// =============================================================================

TEST_CASE("noteToFrequency follows 440 * 2^((n - 9) / 12)", "[core][pitch][layer0]") {
    const int pc = GENERATE(range(0, kNumPitchClasses));
    const int octave = GENERATE(-4, -1, 0, 1, 3);

    const Note note{static_cast<PitchClass>(pc), octave};
    const double n = static_cast<double>(pc + 12 * octave);
    const double expected = 440.0 * std::pow(2.0, (n - 9.0) / 12.0);

    REQUIRE(semitoneIndex(note) == pc + 12 * octave);
    REQUIRE(noteToFrequency(note) == Approx(expected).epsilon(1e-12));
}

TEST_CASE("noteToFrequency doubles per octave", "[core][pitch][layer0]") {
    const int pc = GENERATE(range(0, kNumPitchClasses));
    const int octave = GENERATE(-3, -1, 0, 2);

    const double low = noteToFrequency({static_cast<PitchClass>(pc), octave});
    const double high = noteToFrequency({static_cast<PitchClass>(pc), octave + 1});
    REQUIRE(high == Approx(2.0 * low).epsilon(1e-12));
}

TEST_CASE("noteToFrequency rises strictly within an octave", "[core][pitch][layer0]") {
    const int octave = GENERATE(-2, 0, 1);
    for (int pc = 1; pc < kNumPitchClasses; ++pc) {
        const double below = noteToFrequency({static_cast<PitchClass>(pc - 1), octave});
        const double above = noteToFrequency({static_cast<PitchClass>(pc), octave});
        INFO("pitch class " << pc << " octave " << octave);
        REQUIRE(above > below);
    }
}

TEST_CASE("semitoneIndex is exact for every int octave", "[core][pitch][layer0]") {
    REQUIRE(semitoneIndex({PitchClass::C, 200000000}) == int64_t{2400000000});
    REQUIRE(semitoneIndex({PitchClass::H, std::numeric_limits<int>::max()}) ==
            int64_t{11} + int64_t{12} * std::numeric_limits<int>::max());
    REQUIRE(semitoneIndex({PitchClass::C, std::numeric_limits<int>::min()}) ==
            int64_t{12} * std::numeric_limits<int>::min());

    // Far outside the audible range the frequency saturates instead of wrapping
    REQUIRE(std::isinf(noteToFrequency({PitchClass::C, 200000000})));
    REQUIRE(noteToFrequency({PitchClass::C, -200000000}) == 0.0);
}

// =============================================================================
// Naming
// =============================================================================

TEST_CASE("pitchClassName uses German spelling", "[core][pitch][layer0]") {
    REQUIRE(std::string(pitchClassName(PitchClass::C)) == "C");
    REQUIRE(std::string(pitchClassName(PitchClass::Fis)) == "Fis");
    REQUIRE(std::string(pitchClassName(PitchClass::H)) == "H");
}

TEST_CASE("Note compares by pitch class and octave", "[core][pitch][layer0]") {
    REQUIRE(Note{PitchClass::C, 0} == Note{PitchClass::C, 0});
    REQUIRE_FALSE(Note{PitchClass::C, 0} == Note{PitchClass::C, 1});
    REQUIRE_FALSE(Note{PitchClass::C, 0} == Note{PitchClass::Cis, 0});
}
