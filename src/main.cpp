// ==============================================================================
// swapline - plays a note schedule by hot-swapping synth units into a live
// audio stream
// ==============================================================================

#include "engine/audio_device.h"
#include "engine/errors.h"
#include "engine/log.h"
#include "engine/player_config.h"
#include "engine/schedule.h"
#include "engine/sequencer.h"
#include "engine/unit_factory.h"

#include <swapline/dsp/systems/graph_host.h>

#include <atomic>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>

namespace {

std::atomic<Swapline::Sequencer*> gSequencer{nullptr};

void onStopSignal(int /*signal*/) {
    if (Swapline::Sequencer* sequencer = gSequencer.load()) {
        sequencer->requestStop();
    }
}

/// Routes SIGINT/SIGTERM to the sequencer for the guard's lifetime.
class StopSignalScope {
public:
    explicit StopSignalScope(Swapline::Sequencer& sequencer) {
        gSequencer.store(&sequencer);
        std::signal(SIGINT, onStopSignal);
        std::signal(SIGTERM, onStopSignal);
    }
    ~StopSignalScope() {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        gSequencer.store(nullptr);
    }
    StopSignalScope(const StopSignalScope&) = delete;
    StopSignalScope& operator=(const StopSignalScope&) = delete;
};

/// Closes the stream before the graph it pulls from is destroyed.
class StreamScope {
public:
    StreamScope(Swapline::AudioDevice& device, Swapline::DSP::GraphHost& host,
                const Swapline::StreamFormat& format)
        : device_(device) {
        device_.start(host, format);
    }
    ~StreamScope() { device_.stop(); }
    StreamScope(const StreamScope&) = delete;
    StreamScope& operator=(const StreamScope&) = delete;

private:
    Swapline::AudioDevice& device_;
};

int runPlayer(const Swapline::PlayerConfig& config) {
    using namespace Swapline;

    const Schedule schedule = loadSchedule(config);

    AudioDevice device;
    StreamRequest request;
    request.deviceIndex = config.deviceIndex;
    request.sampleRate = config.sampleRate;
    request.channels = config.channels;
    request.format = config.format;
    request.framesPerBuffer = config.framesPerBuffer;
    const StreamFormat format = device.negotiate(request);

    DSP::GraphHost host(format.sampleRate, config.pan);
    UnitFactory factory(format.sampleRate, config.voice);
    Sequencer sequencer(host, factory);
    sequencer.setChordStyle(config.chordStyle);
    sequencer.setEntryObserver([&device](std::size_t index, const ScheduleEntry&) {
        if (const uint64_t errors = device.takeStreamErrors(); errors > 0) {
            SWAPLINE_LOG_WARNING("%llu stream status flags raised before entry %zu",
                                 static_cast<unsigned long long>(errors), index + 1);
        }
    });

    SWAPLINE_LOG_INFO("voice %s, chord style %s, pan %.2f", voiceTypeName(config.voice.type),
                      chordStyleName(config.chordStyle), static_cast<double>(config.pan));

    SequencerStats stats;
    {
        StopSignalScope signals(sequencer);
        StreamScope stream(device, host, format);
        stats = sequencer.run(schedule);
    }

    if (const uint64_t errors = device.takeStreamErrors(); errors > 0) {
        SWAPLINE_LOG_WARNING("%llu stream status flags raised during playback",
                             static_cast<unsigned long long>(errors));
    }
    SWAPLINE_LOG_INFO("%s after %zu/%zu entries: %llu installs, %llu adopted, %llu units reclaimed, "
                      "%lld ms scheduled",
                      stats.stopped ? "stopped" : "finished", stats.entriesPlayed,
                      schedule.entries.size(), static_cast<unsigned long long>(stats.unitsInstalled),
                      static_cast<unsigned long long>(host.adoptedCount()),
                      static_cast<unsigned long long>(stats.unitsReclaimed),
                      static_cast<long long>(stats.scheduledMs));
    SWAPLINE_LOG_DEBUG("%llu audio callbacks",
                       static_cast<unsigned long long>(device.callbackCount()));
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    Swapline::PlayerConfig config;
    try {
        config = Swapline::parseCommandLine(argc, argv);
    } catch (const Swapline::ConfigError& e) {
        SWAPLINE_LOG_ERROR("%s", e.what());
        std::fprintf(stderr, "%s", Swapline::usageText(argv[0]).c_str());
        return 2;
    }

    if (config.showHelp) {
        std::printf("%s", Swapline::usageText(argv[0]).c_str());
        return 0;
    }
    Swapline::setLogLevel(config.logLevel);
#if SWAPLINE_ALLOCATION_GUARD
    SWAPLINE_LOG_DEBUG("allocation guard active: heap use in the audio callback aborts");
#endif

    try {
        return runPlayer(config);
    } catch (const Swapline::ConfigError& e) {
        SWAPLINE_LOG_ERROR("configuration: %s", e.what());
        return 2;
    } catch (const Swapline::DeviceError& e) {
        SWAPLINE_LOG_ERROR("audio device: %s", e.what());
        return 1;
    } catch (const std::exception& e) {
        SWAPLINE_LOG_ERROR("%s", e.what());
        return 1;
    }
}
