// ==============================================================================
// Sequencer Tests
// ==============================================================================
// Drives the sequencer with an injected sleeper that records durations and
// plays the audio thread's part by pulling frames from the host.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "engine/schedule.h"
#include "engine/sequencer.h"
#include "engine/unit_factory.h"

#include <swapline/dsp/core/note_value.h>
#include <swapline/dsp/systems/graph_host.h>

#include <atomic>
#include <chrono>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace Swapline;
using Swapline::DSP::Note;
using Swapline::DSP::PitchClass;
using Catch::Approx;
using std::chrono::milliseconds;

namespace {

constexpr double kSampleRate = 48000.0;

struct Recorder {
    DSP::GraphHost& host;
    std::vector<long long> sleeps;
    std::vector<float> liveFrequencies;

    SleepFunction sleeper() {
        return [this](milliseconds d) {
            sleeps.push_back(d.count());
            for (int i = 0; i < 64; ++i) {
                (void)host.pullFrame();
            }
            liveFrequencies.push_back(host.liveFrequency());
        };
    }
};

Schedule oneNote(Note note, double beats, double bpm) {
    Schedule s;
    s.name = "test";
    s.bpm = bpm;
    s.entries.push_back(ScheduleEntry{{note}, beats});
    return s;
}

} // anonymous namespace

TEST_CASE("Sequencer plays C0 for one beat at 160 BPM", "[sequencer][e2e]") {
    DSP::GraphHost host(kSampleRate);
    UnitFactory factory(kSampleRate, VoiceSettings{});
    Recorder recorder{host};
    Sequencer sequencer(host, factory, recorder.sleeper());

    const SequencerStats stats = sequencer.run(oneNote({PitchClass::C, 0}, 1.0, 160.0));

    REQUIRE(recorder.sleeps == std::vector<long long>{375});
    REQUIRE(recorder.liveFrequencies.size() == 1);
    REQUIRE(recorder.liveFrequencies.front() == Approx(261.626f).margin(0.01f));
    REQUIRE(host.liveFrequency() == Approx(261.626f).margin(0.01f));

    REQUIRE(stats.entriesPlayed == 1);
    REQUIRE(stats.unitsInstalled == 1);
    REQUIRE(stats.scheduledMs == 375);
    REQUIRE_FALSE(stats.stopped);
}

TEST_CASE("Sequencer walks a schedule in order", "[sequencer]") {
    DSP::GraphHost host(kSampleRate);
    UnitFactory factory(kSampleRate, VoiceSettings{});
    Recorder recorder{host};
    Sequencer sequencer(host, factory, recorder.sleeper());

    Schedule s;
    s.bpm = 120.0;
    s.entries = {
        ScheduleEntry{{Note{PitchClass::A, 0}}, 1.0},
        ScheduleEntry{{Note{PitchClass::A, 1}}, 2.0},
        ScheduleEntry{{Note{PitchClass::A, -1}}, 0.5},
    };

    std::vector<std::size_t> observed;
    sequencer.setEntryObserver([&](std::size_t index, const ScheduleEntry&) { observed.push_back(index); });

    const SequencerStats stats = sequencer.run(s);

    REQUIRE(recorder.sleeps == std::vector<long long>{500, 1000, 250});
    REQUIRE(recorder.liveFrequencies == std::vector<float>{440.0f, 880.0f, 220.0f});
    REQUIRE(observed == std::vector<std::size_t>{0, 1, 2});
    REQUIRE(stats.entriesPlayed == 3);
    REQUIRE(stats.unitsInstalled == 3);
    REQUIRE(stats.scheduledMs == 1750);
    // Initial silence plus the first two notes come back to the control thread
    REQUIRE(stats.unitsReclaimed == 3);
}

TEST_CASE("Sequencer chord styles", "[sequencer][chord]") {
    DSP::GraphHost host(kSampleRate);
    UnitFactory factory(kSampleRate, VoiceSettings{});
    Recorder recorder{host};
    Sequencer sequencer(host, factory, recorder.sleeper());
    const Schedule chord = builtinSchedule("chord");

    SECTION("block installs one chord unit for the whole duration") {
        REQUIRE(sequencer.chordStyle() == ChordStyle::Block);
        const SequencerStats stats = sequencer.run(chord);

        REQUIRE(stats.unitsInstalled == 1);
        REQUIRE(recorder.sleeps == std::vector<long long>{1500});
        REQUIRE(host.liveFrequency() == Approx(261.626f).margin(0.01f));
    }

    SECTION("strum installs each note in turn and splits the duration") {
        sequencer.setChordStyle(ChordStyle::Strum);
        const SequencerStats stats = sequencer.run(chord);

        REQUIRE(stats.unitsInstalled == 3);
        REQUIRE(recorder.sleeps == std::vector<long long>{500, 500, 500});
        REQUIRE(recorder.liveFrequencies[0] == Approx(261.626f).margin(0.01f));
        REQUIRE(recorder.liveFrequencies[1] == Approx(329.628f).margin(0.01f));
        REQUIRE(recorder.liveFrequencies[2] == Approx(523.251f).margin(0.01f));
        REQUIRE(stats.scheduledMs == 1500);
    }
}

TEST_CASE("Sequencer strum slices always add up", "[sequencer][chord]") {
    DSP::GraphHost host(kSampleRate);
    UnitFactory factory(kSampleRate, VoiceSettings{});
    Recorder recorder{host};
    Sequencer sequencer(host, factory, recorder.sleeper());
    sequencer.setChordStyle(ChordStyle::Strum);

    Schedule s;
    s.bpm = 160.0;
    s.entries = {ScheduleEntry{{Note{PitchClass::C, 0}, Note{PitchClass::E, 0}, Note{PitchClass::G, 0}}, 1.0}};
    (void)sequencer.run(s);

    REQUIRE(recorder.sleeps.size() == 3);
    REQUIRE(std::accumulate(recorder.sleeps.begin(), recorder.sleeps.end(), 0LL) == 375);
}

TEST_CASE("Sequencer caps an oversized entry instead of skipping it", "[sequencer]") {
    DSP::GraphHost host(kSampleRate);
    UnitFactory factory(kSampleRate, VoiceSettings{});
    Recorder recorder{host};
    Sequencer sequencer(host, factory, recorder.sleeper());
    const auto cap = static_cast<long long>(DSP::kMaxNoteDurationMs);

    SECTION("single note") {
        const SequencerStats stats = sequencer.run(oneNote({PitchClass::A, 0}, 1e300, 160.0));

        REQUIRE(recorder.sleeps == std::vector<long long>{cap});
        REQUIRE(stats.entriesPlayed == 1);
        REQUIRE(stats.scheduledMs == cap);
        REQUIRE(host.liveFrequency() == Approx(440.0f));
    }

    SECTION("strummed chord") {
        sequencer.setChordStyle(ChordStyle::Strum);
        Schedule s;
        s.bpm = 20.0;
        s.entries = {ScheduleEntry{{Note{PitchClass::C, 0}, Note{PitchClass::E, 0}}, 1e14}};
        const SequencerStats stats = sequencer.run(s);

        REQUIRE(recorder.sleeps.size() == 2);
        REQUIRE(std::accumulate(recorder.sleeps.begin(), recorder.sleeps.end(), 0LL) == cap);
        REQUIRE(stats.scheduledMs == cap);
    }
}

TEST_CASE("Sequencer stops when asked", "[sequencer][stop]") {
    DSP::GraphHost host(kSampleRate);
    UnitFactory factory(kSampleRate, VoiceSettings{});

    SECTION("from the injected sleeper") {
        int sleeps = 0;
        Sequencer* self = nullptr;
        Sequencer sequencer(host, factory, [&](milliseconds) {
            if (++sleeps == 2) {
                self->requestStop();
            }
        });
        self = &sequencer;

        const SequencerStats stats = sequencer.run(builtinSchedule("melody"));
        REQUIRE(stats.stopped);
        REQUIRE(stats.entriesPlayed == 2);
        REQUIRE(sleeps == 2);
    }

    SECTION("from another thread while the default sleeper waits") {
        Sequencer sequencer(host, factory);
        std::thread stopper([&] {
            std::this_thread::sleep_for(milliseconds(100));
            sequencer.requestStop();
        });

        const auto start = std::chrono::steady_clock::now();
        // 1 beat at 20 BPM = 3 s
        const SequencerStats stats = sequencer.run(oneNote({PitchClass::C, 0}, 1.0, 20.0));
        const auto elapsed = std::chrono::steady_clock::now() - start;
        stopper.join();

        REQUIRE(stats.stopped);
        REQUIRE(elapsed < milliseconds(2000));
    }
}

TEST_CASE("chordStyleName", "[sequencer]") {
    REQUIRE(std::string(chordStyleName(ChordStyle::Block)) == "block");
    REQUIRE(std::string(chordStyleName(ChordStyle::Strum)) == "strum");
}
