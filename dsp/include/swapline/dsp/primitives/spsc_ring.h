// ==============================================================================
// Layer 1: DSP Primitive - SpscRing
// ==============================================================================
// Lock-free single-producer / single-consumer ring of trivially copyable
// values (unit pointers, in practice). Storage is a fixed array; push() and
// pop() never allocate, lock or block.
//
// One slot is kept free to tell "full" from "empty", so a ring declared with
// Capacity slots holds at most Capacity - 1 values.
// ==============================================================================

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <optional>
#include <type_traits>

namespace Swapline {
namespace DSP {

/// @brief Wait-free SPSC ring buffer.
///
/// push() may only be called from one thread and pop() from one (other)
/// thread. full() is meaningful on the producer side, empty() on the consumer
/// side.
///
/// @tparam T        Trivially copyable element type
/// @tparam Capacity Number of slots (usable capacity is Capacity - 1)
template <typename T, std::size_t Capacity>
class SpscRing {
    static_assert(Capacity >= 2, "SpscRing needs at least two slots");
    static_assert(std::is_trivially_copyable_v<T>, "SpscRing stores trivially copyable values");

public:
    SpscRing() noexcept = default;

    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    // =========================================================================
    // Producer side
    // =========================================================================

    /// @return false if the ring is full (value not stored)
    bool push(const T& value) noexcept {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) % Capacity;
        if (next == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        buffer_[head] = value;
        head_.store(next, std::memory_order_release);
        return true;
    }

    [[nodiscard]] bool full() const noexcept {
        const std::size_t next = (head_.load(std::memory_order_relaxed) + 1) % Capacity;
        return next == tail_.load(std::memory_order_acquire);
    }

    // =========================================================================
    // Consumer side
    // =========================================================================

    /// @return the oldest value, or std::nullopt if the ring is empty
    [[nodiscard]] std::optional<T> pop() noexcept {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        const T value = buffer_[tail];
        tail_.store((tail + 1) % Capacity, std::memory_order_release);
        return value;
    }

    [[nodiscard]] bool empty() const noexcept {
        return tail_.load(std::memory_order_relaxed) == head_.load(std::memory_order_acquire);
    }

    // =========================================================================
    // Either side (approximate while the other side is active)
    // =========================================================================

    [[nodiscard]] std::size_t size() const noexcept {
        const std::size_t head = head_.load(std::memory_order_acquire);
        const std::size_t tail = tail_.load(std::memory_order_acquire);
        return (head >= tail) ? (head - tail) : (Capacity - (tail - head));
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept {
        return Capacity - 1;
    }

private:
    std::array<T, Capacity> buffer_{};
    std::atomic<std::size_t> head_{0};  ///< Next slot to write (producer owned)
    std::atomic<std::size_t> tail_{0};  ///< Next slot to read (consumer owned)
};

} // namespace DSP
} // namespace Swapline
