// ==============================================================================
// Layer 3: System Component - GraphHost
// ==============================================================================
// Owns the fixed signal chain
//
//   [replaceable slot: IAudioUnit] -> StereoPanner -> output frame
//
// and the hand-off protocol that lets the control thread replace the unit in
// the slot while the audio thread keeps pulling frames from it.
//
// Threads:
// - Audio thread:   pullFrame() / pullBlock() only.
// - Control thread: installUnit() / reclaimRetired() and the observers.
//
// Protocol:
// - pending_  (atomic pointer)  control thread exchange()s the new unit in;
//                               the audio thread exchange()s it out.
// - current_  (plain pointer)   touched by the audio thread only.
// - retired_  (SPSC ring)       the audio thread pushes the unit it replaced;
//                               the control thread pops and destroys it.
//
// The audio thread never allocates, frees, locks or waits; the control thread
// never waits on the audio thread. Units are destroyed on the control thread
// (or by the destructor, after the stream has been closed).
// ==============================================================================

#pragma once

#include <swapline/dsp/core/stereo_output.h>
#include <swapline/dsp/primitives/spsc_ring.h>
#include <swapline/dsp/primitives/stereo_panner.h>
#include <swapline/dsp/processors/i_audio_unit.h>
#include <swapline/dsp/processors/silence_unit.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

namespace Swapline::DSP {

/// Units handed back to the control thread for disposal. Empty when nothing
/// was reclaimed.
using RetiredUnits = std::vector<std::unique_ptr<IAudioUnit>>;

/// @brief Real-time boundary between the sequencer and the audio callback.
///
/// Guarantees:
/// - pullFrame() always ticks one wholly-installed unit; a swap is atomic as
///   seen from the audio thread.
/// - Once installUnit(X) has returned, every later pullFrame() uses X or a
///   unit installed after X. A unit displaced while still pending is handed
///   back to the caller without ever being played.
/// - installUnit() never blocks on the audio thread.
///
/// @par Example Usage
/// @code
/// GraphHost host(48000.0);
///
/// // Control thread
/// RetiredUnits old = host.installUnit(std::make_unique<SineTone>(48000.0, 440.0f));
/// old.clear();  // units are destroyed here, never on the audio thread
///
/// // Audio thread
/// StereoOutput frame = host.pullFrame();
/// @endcode
class GraphHost {
public:
    // =========================================================================
    // Constants
    // =========================================================================

    /// Slots in the retire ring. At most two units are ever in flight between
    /// control-side drains, so adoption is never deferred in practice.
    static constexpr std::size_t kRetireSlots = 8;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @param sampleRate  Stream sample rate in Hz (must be > 0)
    /// @param panPosition Fixed panner position in [-1, 1]
    /// @throws std::invalid_argument if sampleRate is not positive
    explicit GraphHost(double sampleRate, float panPosition = 0.0f)
        : sampleRate_(validatedSampleRate(sampleRate))
        , panner_(panPosition)
        , current_(new SilenceUnit()) {}

    /// Destroys the live, pending and retired units.
    /// @pre No thread is inside pullFrame() (the stream is closed).
    ~GraphHost() {
        delete pending_.exchange(nullptr, std::memory_order_acq_rel);
        while (auto unit = retired_.pop()) {
            delete *unit;
        }
        delete current_;
    }

    GraphHost(const GraphHost&) = delete;
    GraphHost& operator=(const GraphHost&) = delete;
    GraphHost(GraphHost&&) = delete;
    GraphHost& operator=(GraphHost&&) = delete;

    // =========================================================================
    // Audio thread
    // =========================================================================

    /// @brief Produce one output frame.
    ///
    /// Adopts a pending unit if one is waiting, ticks the live unit once and
    /// routes the frame through the panner. Bounded time; no allocation,
    /// deallocation, lock or system call.
    [[nodiscard]] StereoOutput pullFrame() noexcept {
        adoptPendingUnit();
        return panner_.process(current_->nextSample());
    }

    /// @brief Fill planar buffers with numFrames consecutive frames.
    void pullBlock(float* left, float* right, std::size_t numFrames) noexcept {
        if (left == nullptr || right == nullptr) {
            return;
        }
        for (std::size_t i = 0; i < numFrames; ++i) {
            const StereoOutput frame = pullFrame();
            left[i] = frame.left;
            right[i] = frame.right;
        }
    }

    // =========================================================================
    // Control thread
    // =========================================================================

    /// @brief Install a unit into the replaceable slot.
    ///
    /// The next pullFrame() observes the new unit. Returns every unit the
    /// audio thread has retired so far plus the pending unit this call
    /// displaced, if the audio thread never picked it up. The first install
    /// returns an empty list.
    ///
    /// @throws std::invalid_argument if unit is null
    [[nodiscard]] RetiredUnits installUnit(std::unique_ptr<IAudioUnit> unit) {
        if (!unit) {
            throw std::invalid_argument("GraphHost::installUnit: unit is null");
        }

        // Drain first: this bounds the ring to the retirements that can race
        // with the exchange below.
        RetiredUnits reclaimed = reclaimRetired();
        reclaimed.reserve(reclaimed.size() + 1);

        IAudioUnit* displaced = pending_.exchange(unit.release(), std::memory_order_acq_rel);
        installs_.fetch_add(1, std::memory_order_relaxed);

        if (displaced != nullptr) {
            reclaimed.emplace_back(displaced);
        }
        return reclaimed;
    }

    /// @brief Take ownership of units the audio thread has swapped out.
    [[nodiscard]] RetiredUnits reclaimRetired() {
        RetiredUnits reclaimed;
        while (auto unit = retired_.pop()) {
            reclaimed.emplace_back(*unit);
        }
        return reclaimed;
    }

    // =========================================================================
    // Observers (any thread)
    // =========================================================================

    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }

    [[nodiscard]] float panPosition() const noexcept { return panner_.getPan(); }

    /// Units passed to installUnit()
    [[nodiscard]] uint64_t installCount() const noexcept {
        return installs_.load(std::memory_order_relaxed);
    }

    /// Units the audio thread has adopted
    [[nodiscard]] uint64_t adoptedCount() const noexcept {
        return adopted_.load(std::memory_order_relaxed);
    }

    /// Frequency of the unit the audio thread is playing (0 before the first adoption)
    [[nodiscard]] float liveFrequency() const noexcept {
        return liveFrequency_.load(std::memory_order_relaxed);
    }

    /// True if an installed unit has not been adopted yet
    [[nodiscard]] bool hasPendingUnit() const noexcept {
        return pending_.load(std::memory_order_acquire) != nullptr;
    }

private:
    // sampleRate_ is declared first, so this runs before the silence unit is allocated
    static double validatedSampleRate(double sampleRate) {
        if (!(sampleRate > 0.0)) {
            throw std::invalid_argument("GraphHost sample rate must be > 0");
        }
        return sampleRate;
    }

    void adoptPendingUnit() noexcept {
        if (pending_.load(std::memory_order_relaxed) == nullptr) {
            return;
        }
        // Keep playing the current unit until the control thread drains.
        if (retired_.full()) {
            return;
        }
        IAudioUnit* next = pending_.exchange(nullptr, std::memory_order_acq_rel);
        if (next == nullptr) {
            return;
        }
        // Cannot fail: this thread is the only producer and the ring was not full.
        retired_.push(current_);
        current_ = next;
        liveFrequency_.store(next->frequency(), std::memory_order_relaxed);
        adopted_.fetch_add(1, std::memory_order_relaxed);
    }

    double sampleRate_;
    StereoPanner panner_;

    IAudioUnit* current_;
    std::atomic<IAudioUnit*> pending_{nullptr};
    SpscRing<IAudioUnit*, kRetireSlots> retired_;

    std::atomic<uint64_t> installs_{0};
    std::atomic<uint64_t> adopted_{0};
    std::atomic<float> liveFrequency_{0.0f};
};

} // namespace Swapline::DSP
