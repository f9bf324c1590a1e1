// ==============================================================================
// Global Allocation Hooks
// ==============================================================================
// Replaces the global operator new / delete family so heap traffic inside a
// RealtimeScope is reported to the guard in realtime_guard.h.
//
// Linked into the test binaries and, with SWAPLINE_ALLOCATION_GUARD=ON, into
// the player. Outside a RealtimeScope the hooks only forward to malloc/free.
// ==============================================================================

#include <swapline/dsp/core/realtime_guard.h>

#include <cstdlib>
#include <new>

namespace {

void* allocateOrNull(std::size_t size) noexcept {
    void* p = std::malloc(size == 0 ? 1 : size);
    if (p != nullptr) {
        Swapline::DSP::noteHeapAllocation();
    }
    return p;
}

void* allocateAlignedOrNull(std::size_t size, std::align_val_t alignment) noexcept {
    const auto align = static_cast<std::size_t>(alignment);
    // aligned_alloc requires the size to be a multiple of the alignment
    const std::size_t rounded = ((size == 0 ? 1 : size) + align - 1) / align * align;
    void* p = std::aligned_alloc(align, rounded);
    if (p != nullptr) {
        Swapline::DSP::noteHeapAllocation();
    }
    return p;
}

void release(void* p) noexcept {
    if (p == nullptr) {
        return;
    }
    Swapline::DSP::noteHeapDeallocation();
    std::free(p);
}

} // anonymous namespace

void* operator new(std::size_t size) {
    void* p = allocateOrNull(size);
    if (p == nullptr) throw std::bad_alloc();
    return p;
}

void* operator new[](std::size_t size) {
    void* p = allocateOrNull(size);
    if (p == nullptr) throw std::bad_alloc();
    return p;
}

void* operator new(std::size_t size, const std::nothrow_t&) noexcept {
    return allocateOrNull(size);
}

void* operator new[](std::size_t size, const std::nothrow_t&) noexcept {
    return allocateOrNull(size);
}

void* operator new(std::size_t size, std::align_val_t alignment) {
    void* p = allocateAlignedOrNull(size, alignment);
    if (p == nullptr) throw std::bad_alloc();
    return p;
}

void* operator new[](std::size_t size, std::align_val_t alignment) {
    void* p = allocateAlignedOrNull(size, alignment);
    if (p == nullptr) throw std::bad_alloc();
    return p;
}

void operator delete(void* p) noexcept {
    release(p);
}

void operator delete[](void* p) noexcept {
    release(p);
}

void operator delete(void* p, [[maybe_unused]] std::size_t size) noexcept {
    release(p);
}

void operator delete[](void* p, [[maybe_unused]] std::size_t size) noexcept {
    release(p);
}

void operator delete(void* p, const std::nothrow_t&) noexcept {
    release(p);
}

void operator delete[](void* p, const std::nothrow_t&) noexcept {
    release(p);
}

void operator delete(void* p, std::align_val_t) noexcept {
    release(p);
}

void operator delete[](void* p, std::align_val_t) noexcept {
    release(p);
}

void operator delete(void* p, [[maybe_unused]] std::size_t size, std::align_val_t) noexcept {
    release(p);
}

void operator delete[](void* p, [[maybe_unused]] std::size_t size, std::align_val_t) noexcept {
    release(p);
}
