// ==============================================================================
// Schedule Tests
// ==============================================================================
// Built-in schedules, note-name parsing and the JSON schedule format.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "engine/errors.h"
#include "engine/schedule.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace Swapline;
using Swapline::DSP::Note;
using Swapline::DSP::PitchClass;
using Catch::Approx;

// =============================================================================
// Built-in schedules
// =============================================================================

TEST_CASE("melody schedule", "[schedule][builtin]") {
    const Schedule s = builtinSchedule("melody");

    REQUIRE(s.name == "melody");
    REQUIRE(s.bpm == 160.0);
    REQUIRE(s.entries.size() == 27);
    REQUIRE(s.entries.front().notes == std::vector<Note>{{PitchClass::C, 0}});
    REQUIRE(s.entries.back().notes == std::vector<Note>{{PitchClass::C, 0}});
    REQUIRE(s.entries.back().beats == 3.0);
    REQUIRE(s.totalBeats() == Approx(35.0));

    for (const auto& entry : s.entries) {
        REQUIRE_FALSE(entry.isChord());
    }
}

TEST_CASE("chord schedule", "[schedule][builtin]") {
    const Schedule s = builtinSchedule("chord");

    REQUIRE(s.entries.size() == 1);
    const ScheduleEntry& chord = s.entries.front();
    REQUIRE(chord.isChord());
    REQUIRE(chord.beats == 4.0);
    REQUIRE(chord.notes == std::vector<Note>{{PitchClass::C, 0}, {PitchClass::E, 0}, {PitchClass::C, 1}});
}

TEST_CASE("unknown built-in schedule", "[schedule][builtin]") {
    REQUIRE_THROWS_AS(builtinSchedule("symphony"), ConfigError);
    REQUIRE(builtinScheduleNames() == std::vector<std::string>{"melody", "chord"});
}

// =============================================================================
// Note names
// =============================================================================

TEST_CASE("parseNoteName accepts German and sharp spellings", "[schedule][notes]") {
    REQUIRE(parseNoteName("C0") == Note{PitchClass::C, 0});
    REQUIRE(parseNoteName("A0") == Note{PitchClass::A, 0});
    REQUIRE(parseNoteName("H-1") == Note{PitchClass::H, -1});
    REQUIRE(parseNoteName("Fis2") == Note{PitchClass::Fis, 2});
    REQUIRE(parseNoteName("F#2") == Note{PitchClass::Fis, 2});
    REQUIRE(parseNoteName("cis+1") == Note{PitchClass::Cis, 1});
    REQUIRE(parseNoteName("  G0 ") == Note{PitchClass::G, 0});
}

TEST_CASE("parseNoteName rejects malformed names", "[schedule][notes]") {
    REQUIRE_THROWS_AS(parseNoteName(""), ConfigError);
    REQUIRE_THROWS_AS(parseNoteName("B0"), ConfigError);
    REQUIRE_THROWS_AS(parseNoteName("C"), ConfigError);
    REQUIRE_THROWS_AS(parseNoteName("Cx1"), ConfigError);
    REQUIRE_THROWS_AS(parseNoteName("E#0"), ConfigError);
    REQUIRE_THROWS_AS(parseNoteName("His0"), ConfigError);
    REQUIRE_THROWS_AS(parseNoteName("C0.5"), ConfigError);
}

TEST_CASE("parseNoteName bounds the octave", "[schedule][notes]") {
    REQUIRE(parseNoteName("C10") == Note{PitchClass::C, kMaxNoteOctave});
    REQUIRE(parseNoteName("H-10") == Note{PitchClass::H, kMinNoteOctave});

    REQUIRE_THROWS_AS(parseNoteName("C11"), ConfigError);
    REQUIRE_THROWS_AS(parseNoteName("A-11"), ConfigError);
    REQUIRE_THROWS_AS(parseNoteName("C200000000"), ConfigError);
    REQUIRE_THROWS_AS(parseNoteName("C99999999999999999999"), ConfigError);
    REQUIRE_THROWS_AS(parseScheduleJson(R"({"entries": [{"note": "C200000000"}]})"),
                      ConfigError);
}

TEST_CASE("formatNote is the inverse of parseNoteName", "[schedule][notes]") {
    REQUIRE(formatNote({PitchClass::Cis, 0}) == "Cis0");
    REQUIRE(formatNote({PitchClass::H, -2}) == "H-2");
    REQUIRE(parseNoteName(formatNote({PitchClass::Gis, 3})) == Note{PitchClass::Gis, 3});
}

// =============================================================================
// JSON
// =============================================================================

TEST_CASE("parseScheduleJson reads notes and chords", "[schedule][json]") {
    const Schedule s = parseScheduleJson(R"({
        "name": "intro",
        "bpm": 120,
        "entries": [
            { "note": "C0" },
            { "note": "D0", "beats": 2 },
            { "notes": ["C0", "E0", "C1"], "beats": 4 }
        ]
    })");

    REQUIRE(s.name == "intro");
    REQUIRE(s.bpm == 120.0);
    REQUIRE(s.entries.size() == 3);
    REQUIRE(s.entries[0].beats == 1.0);
    REQUIRE(s.entries[1].notes.front() == Note{PitchClass::D, 0});
    REQUIRE(s.entries[2].isChord());
    REQUIRE(s.totalBeats() == Approx(7.0));
}

TEST_CASE("parseScheduleJson defaults", "[schedule][json]") {
    const Schedule s = parseScheduleJson(R"({"entries": [{"note": "A0"}]})");
    REQUIRE(s.name == "file");
    REQUIRE(s.bpm == kDefaultTempoBPM);
}

TEST_CASE("parseScheduleJson rejects invalid documents", "[schedule][json]") {
    SECTION("not JSON") {
        REQUIRE_THROWS_AS(parseScheduleJson("{entries:"), ConfigError);
    }
    SECTION("not an object") {
        REQUIRE_THROWS_AS(parseScheduleJson("[1, 2]"), ConfigError);
    }
    SECTION("missing entries") {
        REQUIRE_THROWS_AS(parseScheduleJson(R"({"bpm": 100})"), ConfigError);
    }
    SECTION("empty entries") {
        REQUIRE_THROWS_AS(parseScheduleJson(R"({"entries": []})"), ConfigError);
    }
    SECTION("entry without a note") {
        REQUIRE_THROWS_AS(parseScheduleJson(R"({"entries": [{"beats": 1}]})"), ConfigError);
    }
    SECTION("bad note name") {
        REQUIRE_THROWS_AS(parseScheduleJson(R"({"entries": [{"note": "X9"}]})"), ConfigError);
    }
    SECTION("non-positive beats") {
        REQUIRE_THROWS_AS(parseScheduleJson(R"({"entries": [{"note": "C0", "beats": 0}]})"),
                          ConfigError);
    }
    SECTION("beats beyond the longest entry") {
        REQUIRE_THROWS_AS(parseScheduleJson(R"({"entries": [{"note": "C0", "beats": 1e300}]})"),
                          ConfigError);
        REQUIRE_THROWS_AS(parseScheduleJson(R"({"entries": [{"note": "C0", "beats": 1e14}]})"),
                          ConfigError);
        REQUIRE(parseScheduleJson(R"({"entries": [{"note": "C0", "beats": 10000}]})")
                    .entries.front()
                    .beats == kMaxEntryBeats);
    }
    SECTION("tempo out of range") {
        REQUIRE_THROWS_AS(parseScheduleJson(R"({"bpm": 1000, "entries": [{"note": "C0"}]})"),
                          ConfigError);
    }
    SECTION("name is not a string") {
        REQUIRE_THROWS_AS(parseScheduleJson(R"({"name": 3, "entries": [{"note": "C0"}]})"), ConfigError);
    }
    SECTION("empty chord") {
        REQUIRE_THROWS_AS(parseScheduleJson(R"({"entries": [{"notes": []}]})"), ConfigError);
    }
}

TEST_CASE("loadScheduleFromJsonFile", "[schedule][json]") {
    SECTION("missing file") {
        REQUIRE_THROWS_AS(loadScheduleFromJsonFile("/nonexistent/swapline/schedule.json"),
                          ConfigError);
    }

    SECTION("round trip through a file") {
        const std::string path = "swapline_schedule_test.json";
        {
            std::ofstream f(path);
            f << R"({"name": "disk", "entries": [{"note": "E0", "beats": 0.5}]})";
        }
        const Schedule s = loadScheduleFromJsonFile(path);
        std::remove(path.c_str());

        REQUIRE(s.name == "disk");
        REQUIRE(s.entries.size() == 1);
        REQUIRE(s.entries.front().beats == 0.5);
    }
}
