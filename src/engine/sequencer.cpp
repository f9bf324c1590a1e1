// ==============================================================================
// Sequencer Implementation
// ==============================================================================

#include "sequencer.h"

#include "log.h"

#include <swapline/dsp/core/note_value.h>
#include <swapline/dsp/core/pitch_utils.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

namespace Swapline {

namespace {

std::string describeEntry(const ScheduleEntry& entry) {
    std::string text;
    for (const auto& note : entry.notes) {
        if (!text.empty()) {
            text += '+';
        }
        text += formatNote(note);
    }
    return text;
}

} // anonymous namespace

const char* chordStyleName(ChordStyle style) noexcept {
    switch (style) {
        case ChordStyle::Block: return "block";
        case ChordStyle::Strum: return "strum";
    }
    return "unknown";
}

Sequencer::Sequencer(DSP::GraphHost& host, UnitFactory& factory, SleepFunction sleep)
    : host_(host)
    , factory_(factory)
    , sleep_(std::move(sleep)) {}

SequencerStats Sequencer::run(const Schedule& schedule) {
    SequencerStats stats;
    const std::size_t count = schedule.entries.size();

    SWAPLINE_LOG_INFO("playing '%s': %zu entries at %.1f BPM", schedule.name.c_str(), count,
                      DSP::clampTempo(schedule.bpm));

    for (std::size_t i = 0; i < count; ++i) {
        if (stopRequested()) {
            stats.stopped = true;
            break;
        }

        const ScheduleEntry& entry = schedule.entries[i];
        if (entry.notes.empty()) {
            SWAPLINE_LOG_WARNING("entry %zu has no notes, skipped", i);
            continue;
        }

        std::vector<float> frequencies;
        frequencies.reserve(entry.notes.size());
        for (const auto& note : entry.notes) {
            frequencies.push_back(static_cast<float>(DSP::noteToFrequency(note)));
        }

        // Bounded by kMaxNoteDurationMs, so llround and the deadline cannot overflow
        const double totalMs = DSP::beatsToMilliseconds(entry.beats, schedule.bpm);
        SWAPLINE_LOG_INFO("[%zu/%zu] %s %.2f Hz, %.2f beats (%.0f ms)", i + 1, count,
                          describeEntry(entry).c_str(), static_cast<double>(frequencies.front()),
                          entry.beats, totalMs);

        if (entry.isChord() && chordStyle_ == ChordStyle::Strum) {
            // Cumulative rounding keeps the slices summing to the entry length
            const std::size_t n = frequencies.size();
            int64_t elapsed = 0;
            for (std::size_t k = 0; k < n; ++k) {
                install(factory_.makeVoice(frequencies[k]), stats);
                if (k == 0 && observer_) {
                    observer_(i, entry);
                }
                const int64_t end = std::llround(totalMs * static_cast<double>(k + 1) /
                                                 static_cast<double>(n));
                sleepFor(std::chrono::milliseconds(end - elapsed));
                stats.scheduledMs += end - elapsed;
                elapsed = end;
                if (stopRequested()) {
                    break;
                }
            }
        } else {
            install(factory_.makeUnit(frequencies), stats);
            if (observer_) {
                observer_(i, entry);
            }
            const int64_t ms = std::llround(totalMs);
            sleepFor(std::chrono::milliseconds(ms));
            stats.scheduledMs += ms;
        }
        ++stats.entriesPlayed;
    }

    if (stopRequested()) {
        stats.stopped = true;
    }

    DSP::RetiredUnits residual = host_.reclaimRetired();
    stats.unitsReclaimed += residual.size();
    residual.clear();

    SWAPLINE_LOG_DEBUG("sequencer done: %zu entries, %llu installs, %llu reclaimed", stats.entriesPlayed,
                       static_cast<unsigned long long>(stats.unitsInstalled),
                       static_cast<unsigned long long>(stats.unitsReclaimed));
    return stats;
}

void Sequencer::install(std::unique_ptr<DSP::IAudioUnit> unit, SequencerStats& stats) {
    DSP::RetiredUnits old = host_.installUnit(std::move(unit));
    ++stats.unitsInstalled;
    stats.unitsReclaimed += old.size();
    // Destroyed here, on the control thread
    old.clear();
}

void Sequencer::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return;
    }
    if (sleep_) {
        sleep_(duration);
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stopRequested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining + std::chrono::milliseconds(1), kSleepSlice));
    }
}

} // namespace Swapline
