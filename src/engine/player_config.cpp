// ==============================================================================
// Player Configuration Implementation
// ==============================================================================

#include "player_config.h"

#include "errors.h"

#include <swapline/dsp/core/note_value.h>
#include <swapline/dsp/primitives/stereo_panner.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <string_view>

namespace Swapline {

namespace {

double parseNumber(std::string_view option, const char* text) {
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
        throw ConfigError(std::string(option) + ": expected a number, got '" + text + "'");
    }
    return value;
}

double parseRange(std::string_view option, const char* text, double lo, double hi) {
    const double value = parseNumber(option, text);
    if (value < lo || value > hi) {
        throw ConfigError(std::string(option) + ": " + text + " is outside [" + std::to_string(lo) +
                          ", " + std::to_string(hi) + "]");
    }
    return value;
}

long parseInteger(std::string_view option, const char* text, long lo, long hi) {
    errno = 0;
    char* end = nullptr;
    const long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE) {
        throw ConfigError(std::string(option) + ": expected an integer, got '" + text + "'");
    }
    if (value < lo || value > hi) {
        throw ConfigError(std::string(option) + ": " + text + " is outside [" + std::to_string(lo) +
                          ", " + std::to_string(hi) + "]");
    }
    return value;
}

DSP::SampleFormat parseFormat(const char* text) {
    using DSP::SampleFormat;
    for (SampleFormat f : {SampleFormat::Float32, SampleFormat::Int32, SampleFormat::Int16,
                           SampleFormat::Int8, SampleFormat::UInt8}) {
        if (std::strcmp(text, DSP::sampleFormatName(f)) == 0) {
            return f;
        }
    }
    throw ConfigError(std::string("--format: unknown sample format '") + text +
                      "' (expected f32, i32, i16, i8 or u8)");
}

VoiceType parseVoice(const char* text) {
    if (std::strcmp(text, "pluck") == 0) return VoiceType::Pluck;
    if (std::strcmp(text, "sine") == 0) return VoiceType::Sine;
    throw ConfigError(std::string("--voice: unknown voice '") + text + "' (expected pluck or sine)");
}

ChordStyle parseChordStyle(const char* text) {
    if (std::strcmp(text, "block") == 0) return ChordStyle::Block;
    if (std::strcmp(text, "strum") == 0) return ChordStyle::Strum;
    throw ConfigError(std::string("--chord-style: unknown style '") + text +
                      "' (expected block or strum)");
}

} // anonymous namespace

PlayerConfig parseCommandLine(int argc, const char* const* argv) {
    PlayerConfig config;
    bool verbose = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        auto value = [&]() -> const char* {
            if (i + 1 >= argc) {
                throw ConfigError(std::string(a) + ": missing value");
            }
            return argv[++i];
        };

        if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
            config.showHelp = true;
        } else if (std::strcmp(a, "--schedule") == 0) {
            config.scheduleName = value();
            // Validate the name now rather than after the device is open
            (void)builtinSchedule(config.scheduleName);
        } else if (std::strcmp(a, "--schedule-file") == 0) {
            config.scheduleFile = value();
        } else if (std::strcmp(a, "--bpm") == 0) {
            config.bpm = parseRange(a, value(), DSP::kMinTempoBPM, DSP::kMaxTempoBPM);
        } else if (std::strcmp(a, "--voice") == 0) {
            config.voice.type = parseVoice(value());
        } else if (std::strcmp(a, "--pluck-gain") == 0) {
            const double g = parseRange(a, value(), 0.0, 1.0);
            if (g <= 0.0) {
                throw ConfigError("--pluck-gain: must be > 0");
            }
            config.voice.pluck.gainPerSecond = static_cast<float>(g);
        } else if (std::strcmp(a, "--pluck-damping") == 0) {
            config.voice.pluck.damping = static_cast<float>(parseRange(a, value(), 0.0, 1.0));
        } else if (std::strcmp(a, "--pan") == 0) {
            config.pan = static_cast<float>(parseRange(a, value(), DSP::kMinPan, DSP::kMaxPan));
        } else if (std::strcmp(a, "--chord-style") == 0) {
            config.chordStyle = parseChordStyle(value());
        } else if (std::strcmp(a, "--format") == 0) {
            config.format = parseFormat(value());
        } else if (std::strcmp(a, "--sample-rate") == 0) {
            config.sampleRate = parseRange(a, value(), 8000.0, 384000.0);
        } else if (std::strcmp(a, "--channels") == 0) {
            config.channels = static_cast<int>(parseInteger(a, value(), 1, 64));
        } else if (std::strcmp(a, "--device") == 0) {
            config.deviceIndex = static_cast<int>(parseInteger(a, value(), 0, 1024));
        } else if (std::strcmp(a, "--frames") == 0) {
            config.framesPerBuffer = static_cast<unsigned long>(parseInteger(a, value(), 0, 8192));
        } else if (std::strcmp(a, "--verbose") == 0 || std::strcmp(a, "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(a, "--quiet") == 0 || std::strcmp(a, "-q") == 0) {
            quiet = true;
        } else {
            throw ConfigError(std::string("unknown option '") + a + "' (see --help)");
        }
    }

    if (verbose && quiet) {
        throw ConfigError("--verbose and --quiet are mutually exclusive");
    }
    if (verbose) {
        config.logLevel = LogLevel::Debug;
    } else if (quiet) {
        config.logLevel = LogLevel::Warning;
    }
    return config;
}

std::string usageText(const char* program) {
    std::string text = "Usage: ";
    text += program;
    text +=
        " [options]\n"
        "\n"
        "Plays a note schedule through the default audio output, swapping one\n"
        "synthesized unit per note into the running stream.\n"
        "\n"
        "Schedule:\n"
        "  --schedule NAME       Built-in schedule: melody (default) or chord\n"
        "  --schedule-file PATH  JSON schedule, overrides --schedule\n"
        "  --bpm N               Tempo override, 20..300 (default: schedule, 160)\n"
        "  --chord-style S       block (default) or strum\n"
        "\n"
        "Sound:\n"
        "  --voice V             pluck (default) or sine\n"
        "  --pluck-gain G        Amplitude left after one second, (0, 1] (default 0.5)\n"
        "  --pluck-damping D     High-frequency damping, 0..1 (default 0.9)\n"
        "  --pan P               Stereo position, -1..1 (default 0)\n"
        "\n"
        "Device:\n"
        "  --format F            f32 (default), i32, i16, i8 or u8\n"
        "  --sample-rate HZ      Stream sample rate (default: device default)\n"
        "  --channels N          Output channels (default 2, capped to the device)\n"
        "  --device INDEX        Output device index (default: system default)\n"
        "  --frames N            Frames per buffer, 0 lets the device choose\n"
        "\n"
        "  --verbose, -v         Debug logging\n"
        "  --quiet, -q           Warnings and errors only\n"
        "  --help, -h            Show this text\n";
    return text;
}

Schedule loadSchedule(const PlayerConfig& config) {
    Schedule schedule = config.scheduleFile.empty() ? builtinSchedule(config.scheduleName)
                                                    : loadScheduleFromJsonFile(config.scheduleFile);
    if (config.bpm) {
        schedule.bpm = *config.bpm;
    }
    return schedule;
}

} // namespace Swapline
