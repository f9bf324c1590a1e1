#pragma once

// ==============================================================================
// Sequencer
// ==============================================================================
// Control-thread driver: walks a Schedule, builds one unit per entry, installs
// it into the GraphHost and sleeps for the entry's duration. Units handed back
// by the host are destroyed here, never on the audio thread.
// ==============================================================================

#include "schedule.h"
#include "unit_factory.h"

#include <swapline/dsp/systems/graph_host.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace Swapline {

enum class ChordStyle : uint8_t {
    Block = 0,  ///< All chord notes in one unit, installed once
    Strum       ///< One install per chord note, duration split evenly
};

[[nodiscard]] const char* chordStyleName(ChordStyle style) noexcept;

/// Blocks the calling thread for the given duration.
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

/// Called after each entry has been installed, before its sleep.
using EntryObserver = std::function<void(std::size_t index, const ScheduleEntry& entry)>;

struct SequencerStats {
    std::size_t entriesPlayed = 0;
    uint64_t unitsInstalled = 0;
    uint64_t unitsReclaimed = 0;
    int64_t scheduledMs = 0;
    bool stopped = false;
};

class Sequencer {
public:
    /// Longest single sleep of the default sleeper before it re-checks for a
    /// stop request.
    static constexpr std::chrono::milliseconds kSleepSlice{50};

    /// @param sleep Replaces the default stop-aware sleeper (tests inject one
    ///              that records durations instead of blocking)
    Sequencer(DSP::GraphHost& host, UnitFactory& factory, SleepFunction sleep = {});

    /// Play the schedule once, in order. Returns early after requestStop().
    SequencerStats run(const Schedule& schedule);

    /// Thread-safe; also callable from a signal handler.
    void requestStop() noexcept { stopRequested_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool stopRequested() const noexcept {
        return stopRequested_.load(std::memory_order_relaxed);
    }

    void setChordStyle(ChordStyle style) noexcept { chordStyle_ = style; }
    [[nodiscard]] ChordStyle chordStyle() const noexcept { return chordStyle_; }

    void setEntryObserver(EntryObserver observer) { observer_ = std::move(observer); }

private:
    void install(std::unique_ptr<DSP::IAudioUnit> unit, SequencerStats& stats);
    void sleepFor(std::chrono::milliseconds duration);

    DSP::GraphHost& host_;
    UnitFactory& factory_;
    SleepFunction sleep_;
    EntryObserver observer_;
    ChordStyle chordStyle_ = ChordStyle::Block;
    std::atomic<bool> stopRequested_{false};
};

} // namespace Swapline
