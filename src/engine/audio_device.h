#pragma once

// ==============================================================================
// Audio Device (PortAudio)
// ==============================================================================
// Owns the PortAudio session and one interleaved output stream whose callback
// pulls frames from a GraphHost through the callback driver.
//
// Threads: every member is called from the control thread. The stream
// callback runs on the device thread and touches only the GraphHost, the
// fixed StreamFormat and an atomic error counter.
// ==============================================================================

#include <swapline/dsp/core/sample_convert.h>
#include <swapline/dsp/systems/graph_host.h>

#include <portaudio.h>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace Swapline {

/// What the player asks for. Unset fields take the device's defaults.
struct StreamRequest {
    std::optional<int> deviceIndex;
    std::optional<double> sampleRate;
    int channels = 2;
    DSP::SampleFormat format = DSP::SampleFormat::Float32;
    unsigned long framesPerBuffer = 0;
};

/// What the device agreed to.
struct StreamFormat {
    int deviceIndex = -1;
    std::string deviceName;
    double sampleRate = 0.0;
    int channels = 0;
    DSP::SampleFormat format = DSP::SampleFormat::Float32;
    unsigned long framesPerBuffer = 0;
    double suggestedLatency = 0.0;
};

class AudioDevice {
public:
    /// @throws DeviceError if PortAudio fails to initialize
    AudioDevice();

    /// Stops the stream if it is running and terminates PortAudio.
    ~AudioDevice();

    AudioDevice(const AudioDevice&) = delete;
    AudioDevice& operator=(const AudioDevice&) = delete;

    /// Pick the output device, sample rate, channel count and sample format.
    /// @throws DeviceError if no output device is usable or the format is refused
    [[nodiscard]] StreamFormat negotiate(const StreamRequest& request) const;

    /// Open and start the output stream. host must outlive the stream.
    /// @throws DeviceError if the stream cannot be opened or started
    void start(DSP::GraphHost& host, const StreamFormat& format);

    /// Stop and close the stream. Safe to call repeatedly.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept { return stream_ != nullptr; }

    /// Underflow/overflow/priming flags reported to the callback since the
    /// previous call.
    [[nodiscard]] uint64_t takeStreamErrors() noexcept {
        return streamErrors_.exchange(0, std::memory_order_relaxed);
    }

    /// Callback invocations since start()
    [[nodiscard]] uint64_t callbackCount() const noexcept {
        return callbacks_.load(std::memory_order_relaxed);
    }

private:
    static int streamCallback(const void* input, void* output, unsigned long frameCount,
                              const PaStreamCallbackTimeInfo* timeInfo,
                              PaStreamCallbackFlags statusFlags, void* userData);

    PaStream* stream_ = nullptr;
    DSP::GraphHost* host_ = nullptr;
    StreamFormat format_;
    std::atomic<uint64_t> streamErrors_{0};
    std::atomic<uint64_t> callbacks_{0};
};

/// Map a sample format to PortAudio's constant.
[[nodiscard]] PaSampleFormat toPortAudioFormat(DSP::SampleFormat format) noexcept;

} // namespace Swapline
