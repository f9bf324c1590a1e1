// ==============================================================================
// Layer 0: Core Utility - Real-Time Allocation Guard
// ==============================================================================
// Scoped, thread-local diagnostic mode that marks the current thread as
// executing real-time code. While a RealtimeScope is alive, heap traffic
// reported by the replaced global allocation functions
// (dsp/src/allocation_hooks.cpp) is either fatal or counted.
//
// The state is per thread: a control thread allocating while the audio
// callback runs on another thread is never flagged.
//
// Without the hooks linked in, scopes are still cheap to enter and leave but
// nothing is ever reported.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace Swapline::DSP {

/// What happens when the heap is touched inside a RealtimeScope.
enum class AllocationPolicy : uint8_t {
    Abort = 0,  ///< Print a diagnostic to stderr and abort the process
    Count       ///< Record the event; tests inspect the counters afterwards
};

namespace detail {

struct RealtimeThreadState {
    int depth = 0;
    AllocationPolicy policy = AllocationPolicy::Abort;
    std::size_t allocations = 0;
    std::size_t deallocations = 0;
};

inline thread_local RealtimeThreadState realtimeThreadState{};

inline void reportRealtimeViolation(const char* what) noexcept {
    // fputs does not allocate for an unbuffered stderr.
    std::fputs("swapline: heap ", stderr);
    std::fputs(what, stderr);
    std::fputs(" inside the real-time audio path\n", stderr);
    std::abort();
}

} // namespace detail

/// @return true while the calling thread is inside at least one RealtimeScope
[[nodiscard]] inline bool isInRealtimeScope() noexcept {
    return detail::realtimeThreadState.depth > 0;
}

/// Called by the allocation hooks for every successful allocation.
inline void noteHeapAllocation() noexcept {
    auto& state = detail::realtimeThreadState;
    if (state.depth == 0) {
        return;
    }
    ++state.allocations;
    if (state.policy == AllocationPolicy::Abort) {
        detail::reportRealtimeViolation("allocation");
    }
}

/// Called by the allocation hooks for every non-null deallocation.
inline void noteHeapDeallocation() noexcept {
    auto& state = detail::realtimeThreadState;
    if (state.depth == 0) {
        return;
    }
    ++state.deallocations;
    if (state.policy == AllocationPolicy::Abort) {
        detail::reportRealtimeViolation("deallocation");
    }
}

/// @brief RAII marker for real-time code on the current thread.
///
/// Scopes nest and the outer policy is restored on exit. Inside a Count scope
/// every nested scope counts too, so a test can wrap code that opens its own
/// Abort scope. Counters are reported relative to the scope's own entry.
///
/// @code
/// void audioCallback(...) noexcept {
///     RealtimeScope scope;           // aborts on heap use
///     ...
/// }
///
/// RealtimeScope scope{AllocationPolicy::Count};
/// host.pullFrame();
/// REQUIRE(scope.allocationCount() == 0);
/// @endcode
class RealtimeScope {
public:
    explicit RealtimeScope(AllocationPolicy policy = AllocationPolicy::Abort) noexcept
        : previousPolicy_(detail::realtimeThreadState.policy)
        , allocationsAtEntry_(detail::realtimeThreadState.allocations)
        , deallocationsAtEntry_(detail::realtimeThreadState.deallocations) {
        auto& state = detail::realtimeThreadState;
        if (state.depth == 0 || state.policy != AllocationPolicy::Count) {
            state.policy = policy;
        }
        ++state.depth;
    }

    ~RealtimeScope() {
        auto& state = detail::realtimeThreadState;
        --state.depth;
        state.policy = previousPolicy_;
    }

    RealtimeScope(const RealtimeScope&) = delete;
    RealtimeScope& operator=(const RealtimeScope&) = delete;
    RealtimeScope(RealtimeScope&&) = delete;
    RealtimeScope& operator=(RealtimeScope&&) = delete;

    /// Allocations seen on this thread since the scope was entered
    [[nodiscard]] std::size_t allocationCount() const noexcept {
        return detail::realtimeThreadState.allocations - allocationsAtEntry_;
    }

    /// Deallocations seen on this thread since the scope was entered
    [[nodiscard]] std::size_t deallocationCount() const noexcept {
        return detail::realtimeThreadState.deallocations - deallocationsAtEntry_;
    }

private:
    AllocationPolicy previousPolicy_;
    std::size_t allocationsAtEntry_;
    std::size_t deallocationsAtEntry_;
};

} // namespace Swapline::DSP
