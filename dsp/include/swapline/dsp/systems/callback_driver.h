// ==============================================================================
// Layer 3: System Component - Real-Time Callback Driver
// ==============================================================================
// Bridges the device's interleaved output buffer to GraphHost::pullFrame().
//
// For every frame: one pullFrame(), convert left/right to the device sample
// type, then write each channel by parity (even index = left, odd = right),
// so a device with more than two channels receives the stereo pair repeated.
// A mono device receives the left channel.
//
// Runs inside a RealtimeScope: with the allocation hooks linked, any heap use
// on this path aborts the process. No locks, no logging.
// ==============================================================================

#pragma once

#include <swapline/dsp/core/realtime_guard.h>
#include <swapline/dsp/core/sample_convert.h>
#include <swapline/dsp/core/stereo_output.h>
#include <swapline/dsp/systems/graph_host.h>

#include <cstddef>
#include <cstdint>

namespace Swapline::DSP {

/// @brief Fill an interleaved buffer of numFrames * numChannels samples.
///
/// @tparam SampleT Device sample type (float, int32_t, int16_t, int8_t, uint8_t)
/// @param host        Graph to pull from (audio-thread side)
/// @param output      Interleaved device buffer
/// @param numFrames   Frames requested by the device
/// @param numChannels Channels per frame reported by the device
template <typename SampleT>
void renderInterleaved(GraphHost& host, SampleT* output, std::size_t numFrames,
                       std::size_t numChannels) noexcept {
    if (output == nullptr || numChannels == 0) {
        return;
    }

    RealtimeScope realtime;

    for (std::size_t frame = 0; frame < numFrames; ++frame) {
        const StereoOutput sample = host.pullFrame();
        const SampleT left = convertSample<SampleT>(sample.left);
        const SampleT right = convertSample<SampleT>(sample.right);

        SampleT* out = output + frame * numChannels;
        for (std::size_t channel = 0; channel < numChannels; ++channel) {
            out[channel] = (channel & 1u) == 0 ? left : right;
        }
    }
}

/// @brief Fill an interleaved buffer with the format's zero level.
template <typename SampleT>
void renderSilence(SampleT* output, std::size_t numFrames, std::size_t numChannels) noexcept {
    if (output == nullptr) {
        return;
    }
    const SampleT zero = convertSample<SampleT>(0.0f);
    const std::size_t total = numFrames * numChannels;
    for (std::size_t i = 0; i < total; ++i) {
        output[i] = zero;
    }
}

/// @brief Type-erased entry point for drivers that negotiate the format at run time.
///
/// @param output Interleaved buffer whose element type matches format
inline void renderInterleaved(GraphHost& host, SampleFormat format, void* output,
                              std::size_t numFrames, std::size_t numChannels) noexcept {
    switch (format) {
        case SampleFormat::Float32:
            renderInterleaved(host, static_cast<float*>(output), numFrames, numChannels);
            break;
        case SampleFormat::Int32:
            renderInterleaved(host, static_cast<int32_t*>(output), numFrames, numChannels);
            break;
        case SampleFormat::Int16:
            renderInterleaved(host, static_cast<int16_t*>(output), numFrames, numChannels);
            break;
        case SampleFormat::Int8:
            renderInterleaved(host, static_cast<int8_t*>(output), numFrames, numChannels);
            break;
        case SampleFormat::UInt8:
            renderInterleaved(host, static_cast<uint8_t*>(output), numFrames, numChannels);
            break;
    }
}

/// @brief Type-erased silence for the same formats.
inline void renderSilence(SampleFormat format, void* output, std::size_t numFrames,
                          std::size_t numChannels) noexcept {
    switch (format) {
        case SampleFormat::Float32:
            renderSilence(static_cast<float*>(output), numFrames, numChannels);
            break;
        case SampleFormat::Int32:
            renderSilence(static_cast<int32_t*>(output), numFrames, numChannels);
            break;
        case SampleFormat::Int16:
            renderSilence(static_cast<int16_t*>(output), numFrames, numChannels);
            break;
        case SampleFormat::Int8:
            renderSilence(static_cast<int8_t*>(output), numFrames, numChannels);
            break;
        case SampleFormat::UInt8:
            renderSilence(static_cast<uint8_t*>(output), numFrames, numChannels);
            break;
    }
}

} // namespace Swapline::DSP
