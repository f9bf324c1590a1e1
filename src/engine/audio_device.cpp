// ==============================================================================
// Audio Device Implementation
// ==============================================================================

#include "audio_device.h"

#include "errors.h"
#include "log.h"

#include <swapline/dsp/systems/callback_driver.h>

#include <algorithm>

namespace Swapline {

namespace {

[[noreturn]] void throwPaError(const std::string& what, PaError err) {
    throw DeviceError(what + ": " + Pa_GetErrorText(err) + " (" + std::to_string(err) + ")");
}

} // anonymous namespace

PaSampleFormat toPortAudioFormat(DSP::SampleFormat format) noexcept {
    switch (format) {
        case DSP::SampleFormat::Float32: return paFloat32;
        case DSP::SampleFormat::Int32: return paInt32;
        case DSP::SampleFormat::Int16: return paInt16;
        case DSP::SampleFormat::Int8: return paInt8;
        case DSP::SampleFormat::UInt8: return paUInt8;
    }
    return paFloat32;
}

AudioDevice::AudioDevice() {
    const PaError err = Pa_Initialize();
    if (err != paNoError) {
        throwPaError("Pa_Initialize failed", err);
    }
    SWAPLINE_LOG_DEBUG("%s", Pa_GetVersionText());
}

AudioDevice::~AudioDevice() {
    stop();
    const PaError err = Pa_Terminate();
    if (err != paNoError) {
        SWAPLINE_LOG_WARNING("Pa_Terminate failed: %s", Pa_GetErrorText(err));
    }
}

StreamFormat AudioDevice::negotiate(const StreamRequest& request) const {
    PaDeviceIndex device = paNoDevice;
    if (request.deviceIndex) {
        const PaDeviceIndex count = Pa_GetDeviceCount();
        if (count < 0) {
            throwPaError("Pa_GetDeviceCount failed", count);
        }
        if (*request.deviceIndex < 0 || *request.deviceIndex >= count) {
            throw DeviceError("device index " + std::to_string(*request.deviceIndex) +
                              " out of range (" + std::to_string(count) + " devices)");
        }
        device = *request.deviceIndex;
    } else {
        device = Pa_GetDefaultOutputDevice();
        if (device == paNoDevice) {
            throw DeviceError("no default output device available");
        }
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (info == nullptr) {
        throw DeviceError("no info for device " + std::to_string(device));
    }
    if (info->maxOutputChannels <= 0) {
        throw DeviceError(std::string("device '") + info->name + "' has no output channels");
    }

    StreamFormat format;
    format.deviceIndex = device;
    format.deviceName = info->name;
    format.sampleRate = request.sampleRate.value_or(info->defaultSampleRate);
    format.channels = std::clamp(request.channels, 1, info->maxOutputChannels);
    format.format = request.format;
    format.framesPerBuffer = request.framesPerBuffer;
    format.suggestedLatency = info->defaultLowOutputLatency;

    if (format.channels != request.channels) {
        SWAPLINE_LOG_WARNING("device '%s' supports %d output channels, using %d", info->name,
                             info->maxOutputChannels, format.channels);
    }

    PaStreamParameters params{};
    params.device = device;
    params.channelCount = format.channels;
    params.sampleFormat = toPortAudioFormat(format.format);
    params.suggestedLatency = format.suggestedLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    const PaError supported = Pa_IsFormatSupported(nullptr, &params, format.sampleRate);
    if (supported != paFormatIsSupported) {
        throwPaError(std::string("device '") + info->name + "' refused " +
                         DSP::sampleFormatName(format.format) + " at " +
                         std::to_string(format.sampleRate) + " Hz",
                     supported);
    }
    return format;
}

void AudioDevice::start(DSP::GraphHost& host, const StreamFormat& format) {
    if (stream_ != nullptr) {
        throw DeviceError("stream already running");
    }

    host_ = &host;
    format_ = format;
    streamErrors_.store(0, std::memory_order_relaxed);
    callbacks_.store(0, std::memory_order_relaxed);

    PaStreamParameters params{};
    params.device = format.deviceIndex;
    params.channelCount = format.channels;
    params.sampleFormat = toPortAudioFormat(format.format);
    params.suggestedLatency = format.suggestedLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    const unsigned long frames =
        format.framesPerBuffer == 0 ? paFramesPerBufferUnspecified : format.framesPerBuffer;

    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(&stream, nullptr, &params, format.sampleRate, frames, paClipOff,
                                &AudioDevice::streamCallback, this);
    if (err != paNoError) {
        throwPaError("Pa_OpenStream failed", err);
    }

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        const PaError closeErr = Pa_CloseStream(stream);
        if (closeErr != paNoError) {
            SWAPLINE_LOG_WARNING("Pa_CloseStream failed: %s", Pa_GetErrorText(closeErr));
        }
        throwPaError("Pa_StartStream failed", err);
    }
    stream_ = stream;

    if (const PaStreamInfo* info = Pa_GetStreamInfo(stream_)) {
        SWAPLINE_LOG_INFO("stream on '%s': %.0f Hz, %d ch, %s, latency %.1f ms",
                          format.deviceName.c_str(), info->sampleRate, format.channels,
                          DSP::sampleFormatName(format.format), info->outputLatency * 1000.0);
    }
}

void AudioDevice::stop() {
    if (stream_ == nullptr) {
        return;
    }
    PaError err = Pa_StopStream(stream_);
    if (err != paNoError) {
        SWAPLINE_LOG_WARNING("Pa_StopStream failed: %s", Pa_GetErrorText(err));
    }
    err = Pa_CloseStream(stream_);
    if (err != paNoError) {
        SWAPLINE_LOG_WARNING("Pa_CloseStream failed: %s", Pa_GetErrorText(err));
    }
    stream_ = nullptr;
}

int AudioDevice::streamCallback(const void* /*input*/, void* output, unsigned long frameCount,
                                const PaStreamCallbackTimeInfo* /*timeInfo*/,
                                PaStreamCallbackFlags statusFlags, void* userData) {
    auto* self = static_cast<AudioDevice*>(userData);
    self->callbacks_.fetch_add(1, std::memory_order_relaxed);

    if (statusFlags != 0) {
        self->streamErrors_.fetch_add(1, std::memory_order_relaxed);
    }

    const auto channels = static_cast<std::size_t>(self->format_.channels);
    if (self->host_ == nullptr) {
        DSP::renderSilence(self->format_.format, output, frameCount, channels);
        return paContinue;
    }
    DSP::renderInterleaved(*self->host_, self->format_.format, output, frameCount, channels);
    return paContinue;
}

} // namespace Swapline
