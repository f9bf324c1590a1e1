#pragma once

// ==============================================================================
// Player Configuration
// ==============================================================================
// Command line options for the swapline player. Parsed once at startup;
// every value is range checked here so later stages can trust it.
// ==============================================================================

#include "log.h"
#include "schedule.h"
#include "sequencer.h"
#include "unit_factory.h"

#include <swapline/dsp/core/sample_convert.h>

#include <optional>
#include <string>

namespace Swapline {

struct PlayerConfig {
    // Schedule
    std::string scheduleName = "melody";
    std::string scheduleFile;            ///< Overrides scheduleName when set
    std::optional<double> bpm;           ///< Overrides the schedule's tempo
    ChordStyle chordStyle = ChordStyle::Block;

    // Sound
    VoiceSettings voice;
    float pan = 0.0f;

    // Device
    DSP::SampleFormat format = DSP::SampleFormat::Float32;
    std::optional<double> sampleRate;    ///< Device default when unset
    int channels = 2;
    std::optional<int> deviceIndex;      ///< Default output device when unset
    unsigned long framesPerBuffer = 0;   ///< 0 lets the device choose

    LogLevel logLevel = LogLevel::Info;
    bool showHelp = false;
};

/// @throws ConfigError on unknown options, missing values or out-of-range values
[[nodiscard]] PlayerConfig parseCommandLine(int argc, const char* const* argv);

[[nodiscard]] std::string usageText(const char* program);

/// Resolve the configured schedule (file or built-in) and apply --bpm.
/// @throws ConfigError
[[nodiscard]] Schedule loadSchedule(const PlayerConfig& config);

} // namespace Swapline
