// ==============================================================================
// Note Schedule Implementation
// ==============================================================================

#include "schedule.h"

#include "errors.h"

#include <swapline/dsp/core/note_value.h>

#include <nlohmann/json.hpp>

#include <cctype>
#include <charconv>
#include <fstream>
#include <numeric>
#include <sstream>
#include <utility>

using nlohmann::json;

namespace Swapline {

namespace {

using DSP::Note;
using DSP::PitchClass;

ScheduleEntry single(PitchClass pc, int octave, double beats) {
    return ScheduleEntry{{Note{pc, octave}}, beats};
}

Schedule makeMelody() {
    using enum PitchClass;
    Schedule s;
    s.name = "melody";
    s.bpm = kDefaultTempoBPM;
    s.entries = {
        single(C, 0, 1), single(D, 0, 1), single(E, 0, 1), single(F, 0, 1),
        single(G, 0, 2), single(G, 0, 2),
        single(A, 0, 1), single(A, 0, 1), single(A, 0, 1), single(A, 0, 1),
        single(G, 0, 2),
        single(A, 0, 1), single(A, 0, 1), single(A, 0, 1), single(A, 0, 1),
        single(G, 0, 2),
        single(F, 0, 1), single(F, 0, 1), single(F, 0, 1), single(F, 0, 1),
        single(E, 0, 2), single(E, 0, 2),
        single(D, 0, 1), single(D, 0, 1), single(D, 0, 1), single(D, 0, 1),
        single(C, 0, 3),
    };
    return s;
}

Schedule makeChord() {
    using enum PitchClass;
    Schedule s;
    s.name = "chord";
    s.bpm = kDefaultTempoBPM;
    s.entries = {ScheduleEntry{{Note{C, 0}, Note{E, 0}, Note{C, 1}}, 4.0}};
    return s;
}

/// Map a note letter to its natural pitch class; H is B natural.
bool naturalPitchClass(char letter, int& index) {
    switch (std::toupper(static_cast<unsigned char>(letter))) {
        case 'C': index = 0; return true;
        case 'D': index = 2; return true;
        case 'E': index = 4; return true;
        case 'F': index = 5; return true;
        case 'G': index = 7; return true;
        case 'A': index = 9; return true;
        case 'H': index = 11; return true;
        default: return false;
    }
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

ScheduleEntry parseEntry(const json& j, std::size_t index) {
    const std::string where = "schedule entry " + std::to_string(index);
    if (!j.is_object()) {
        throw ConfigError(where + ": expected an object");
    }

    ScheduleEntry entry;
    if (j.contains("notes")) {
        const json& notes = j.at("notes");
        if (!notes.is_array() || notes.empty()) {
            throw ConfigError(where + ": 'notes' must be a non-empty array");
        }
        for (const auto& n : notes) {
            if (!n.is_string()) {
                throw ConfigError(where + ": note names must be strings");
            }
            entry.notes.push_back(parseNoteName(n.get<std::string>()));
        }
    } else if (j.contains("note")) {
        const json& n = j.at("note");
        if (!n.is_string()) {
            throw ConfigError(where + ": 'note' must be a string");
        }
        entry.notes.push_back(parseNoteName(n.get<std::string>()));
    } else {
        throw ConfigError(where + ": missing 'note' or 'notes'");
    }

    if (j.contains("beats")) {
        const json& beats = j.at("beats");
        if (!beats.is_number()) {
            throw ConfigError(where + ": 'beats' must be a number");
        }
        entry.beats = beats.get<double>();
        if (!(entry.beats > 0.0)) {
            throw ConfigError(where + ": 'beats' must be > 0");
        }
        if (!(entry.beats <= kMaxEntryBeats)) {
            throw ConfigError(where + ": 'beats' must be <= " +
                              std::to_string(static_cast<int>(kMaxEntryBeats)));
        }
    }
    return entry;
}

} // anonymous namespace

double Schedule::totalBeats() const noexcept {
    return std::accumulate(entries.begin(), entries.end(), 0.0,
                           [](double sum, const ScheduleEntry& e) { return sum + e.beats; });
}

std::vector<std::string> builtinScheduleNames() {
    return {"melody", "chord"};
}

Schedule builtinSchedule(std::string_view name) {
    if (name == "melody") return makeMelody();
    if (name == "chord") return makeChord();
    throw ConfigError("unknown schedule '" + std::string(name) + "' (expected melody or chord)");
}

Note parseNoteName(std::string_view text) {
    const std::string_view input = trim(text);
    const std::string quoted = "'" + std::string(input) + "'";

    int index = 0;
    if (input.empty() || !naturalPitchClass(input.front(), index)) {
        throw ConfigError("invalid note name " + quoted + ": expected C D E F G A or H");
    }
    std::string_view rest = input.substr(1);

    bool sharp = false;
    if (!rest.empty() && rest.front() == '#') {
        sharp = true;
        rest.remove_prefix(1);
    } else if (rest.size() >= 2 && std::tolower(static_cast<unsigned char>(rest[0])) == 'i' &&
               std::tolower(static_cast<unsigned char>(rest[1])) == 's') {
        sharp = true;
        rest.remove_prefix(2);
    }
    if (sharp) {
        // E# and H# are spelled F and C
        if (index == 4 || index == 11) {
            throw ConfigError("invalid note name " + quoted + ": no sharp on E or H");
        }
        ++index;
    }

    if (!rest.empty() && rest.front() == '+') {
        rest.remove_prefix(1);
    }
    int octave = 0;
    const char* first = rest.data();
    const char* last = rest.data() + rest.size();
    const auto [ptr, ec] = std::from_chars(first, last, octave);
    if (rest.empty() || ec != std::errc() || ptr != last) {
        throw ConfigError("invalid note name " + quoted + ": expected an octave number");
    }
    if (octave < kMinNoteOctave || octave > kMaxNoteOctave) {
        throw ConfigError("invalid note name " + quoted + ": octave out of range (" +
                          std::to_string(kMinNoteOctave) + ".." + std::to_string(kMaxNoteOctave) +
                          ")");
    }

    return Note{static_cast<PitchClass>(index), octave};
}

std::string formatNote(Note note) {
    return std::string(DSP::pitchClassName(note.pitchClass)) + std::to_string(note.octave);
}

Schedule parseScheduleJson(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("schedule JSON parse error: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("schedule JSON must be an object");
    }

    Schedule schedule;
    schedule.name = "file";
    if (j.contains("name")) {
        if (!j.at("name").is_string()) {
            throw ConfigError("schedule 'name' must be a string");
        }
        schedule.name = j.at("name").get<std::string>();
    }

    if (j.contains("bpm")) {
        const json& bpm = j.at("bpm");
        if (!bpm.is_number()) {
            throw ConfigError("schedule 'bpm' must be a number");
        }
        schedule.bpm = bpm.get<double>();
        if (schedule.bpm < DSP::kMinTempoBPM || schedule.bpm > DSP::kMaxTempoBPM) {
            throw ConfigError("schedule 'bpm' out of range (20..300)");
        }
    }

    if (!j.contains("entries") || !j.at("entries").is_array() || j.at("entries").empty()) {
        throw ConfigError("schedule 'entries' must be a non-empty array");
    }
    std::size_t index = 0;
    for (const auto& e : j.at("entries")) {
        schedule.entries.push_back(parseEntry(e, index++));
    }
    return schedule;
}

Schedule loadScheduleFromJsonFile(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigError("failed to open schedule file: " + path);
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return parseScheduleJson(ss.str());
}

} // namespace Swapline
