// ==============================================================================
// IAudioUnit - Interface for Replaceable Sound Generators
// ==============================================================================
// Layer 2: DSP Processors (Interface)
//
// A unit is the generator that sits in GraphHost's replaceable slot. It is
// built on the control thread (where it may allocate), handed to the host,
// ticked on the audio thread, and destroyed back on the control thread.
//
// All implementations must be real-time safe after construction:
// - No allocations or deallocations in nextSample()
// - All tick-path operations noexcept
// ==============================================================================
#pragma once

#include <swapline/dsp/core/stereo_output.h>

namespace Swapline::DSP {

/// @brief Interface for synthesis nodes the graph can swap at run time
///
/// @note nextSample() is the only call made from the audio thread.
class IAudioUnit {
public:
    virtual ~IAudioUnit() = default;

    /// @brief Advance one tick and return the stereo frame
    /// @note Must be real-time safe - no allocations, no blocking
    [[nodiscard]] virtual StereoOutput nextSample() noexcept = 0;

    /// @brief Fundamental frequency the unit was built for
    /// @return Frequency in Hz, or 0 for unpitched units
    [[nodiscard]] virtual float frequency() const noexcept = 0;

    /// @brief Short display name for diagnostics
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace Swapline::DSP
