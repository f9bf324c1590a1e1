#pragma once

// ==============================================================================
// Note Schedule
// ==============================================================================
// Ordered list of (notes, beats) entries plus a tempo, read once at startup.
// An entry with a single note is played as a note, with several as a chord.
//
// Sources:
// - builtinSchedule("melody" | "chord")
// - parseScheduleJson() / loadScheduleFromJsonFile():
//
//     {
//       "name": "intro",
//       "bpm": 160,
//       "entries": [
//         { "note": "C0", "beats": 1 },
//         { "notes": ["C0", "E0", "C1"], "beats": 4 }
//       ]
//     }
//
// Note names: pitch class in German spelling (C Cis D Dis E F Fis G Gis A
// Ais H) or with a sharp (C# D# F# G# A#), followed by a signed octave.
// Octave 0 holds A = 440 Hz.
// ==============================================================================

#include <swapline/dsp/core/pitch_utils.h>

#include <string>
#include <string_view>
#include <vector>

namespace Swapline {

inline constexpr double kDefaultTempoBPM = 160.0;

/// Octaves accepted by parseNoteName()
inline constexpr int kMinNoteOctave = -10;
inline constexpr int kMaxNoteOctave = 10;

/// Longest entry accepted in a JSON schedule
inline constexpr double kMaxEntryBeats = 10000.0;

struct ScheduleEntry {
    std::vector<DSP::Note> notes;
    double beats = 1.0;

    [[nodiscard]] bool isChord() const noexcept { return notes.size() > 1; }
};

struct Schedule {
    std::string name;
    double bpm = kDefaultTempoBPM;
    std::vector<ScheduleEntry> entries;

    /// Sum of all entry durations in beats
    [[nodiscard]] double totalBeats() const noexcept;
};

/// Names accepted by builtinSchedule()
[[nodiscard]] std::vector<std::string> builtinScheduleNames();

/// @throws ConfigError for an unknown name
[[nodiscard]] Schedule builtinSchedule(std::string_view name);

/// Parse "C0", "Fis-1", "C#2", "H0".
/// @throws ConfigError on malformed input or an octave outside
///         [kMinNoteOctave, kMaxNoteOctave]
[[nodiscard]] DSP::Note parseNoteName(std::string_view text);

/// Format a note as "<pitch class><octave>", e.g. "Cis0".
[[nodiscard]] std::string formatNote(DSP::Note note);

/// @throws ConfigError on malformed JSON or schedule content
[[nodiscard]] Schedule parseScheduleJson(const std::string& text);

/// @throws ConfigError if the file cannot be read or parsed
[[nodiscard]] Schedule loadScheduleFromJsonFile(const std::string& path);

} // namespace Swapline
