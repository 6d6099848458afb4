#pragma once

#include <algorithm>
#include <atomic>
#include <bit>
#include <cstddef>
#include <span>
#include <type_traits>
#include <vector>

namespace loopcast {

/// Single-producer single-consumer lock-free sample ring.
///
/// The producer is a real-time audio callback: it stages whole host blocks
/// and never blocks. A block that does not fit is refused as a unit and
/// raises the overflow flag, as does mark_overflow() for data the host lost
/// itself. The consumer takes whole frames, or whatever is left at a
/// deadline, and resynchronizes after an overflow with take_overflow().
template <typename T>
    requires std::is_trivially_copyable_v<T>
class RingBuffer {
public:
    /// Capacity is the next power of two at or above `min_capacity`.
    explicit RingBuffer(std::size_t min_capacity)
        : storage_(std::bit_ceil(std::max<std::size_t>(min_capacity, 1))) {}

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    [[nodiscard]] std::size_t capacity() const noexcept { return storage_.size(); }

    /// Elements staged and not yet taken. Safe from either thread.
    [[nodiscard]] std::size_t size() const noexcept {
        return written_.load(std::memory_order_acquire) - read_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    // Producer side

    /// Stages all of `block`, or none of it and flags an overflow.
    bool push(std::span<const T> block) noexcept {
        const auto written = written_.load(std::memory_order_relaxed);
        const auto room = capacity() - (written - read_.load(std::memory_order_acquire));
        if (block.size() > room) {
            mark_overflow();
            return false;
        }

        const std::size_t at = written & (capacity() - 1);
        const std::size_t head = std::min(block.size(), capacity() - at);
        std::copy_n(block.data(), head, storage_.data() + at);
        std::copy_n(block.data() + head, block.size() - head, storage_.data());

        written_.store(written + block.size(), std::memory_order_release);
        return true;
    }

    void mark_overflow() noexcept { overflowed_.store(true, std::memory_order_release); }

    // Consumer side

    /// Fills all of `frame`, or takes nothing if fewer elements are staged.
    bool pop_frame(std::span<T> frame) noexcept {
        if (size() < frame.size()) {
            return false;
        }
        take(frame);
        return true;
    }

    /// Takes up to out.size() elements. Returns how many were taken.
    std::size_t pop_available(std::span<T> out) noexcept {
        const std::size_t count = std::min(size(), out.size());
        take(out.first(count));
        return count;
    }

    /// Clears the overflow flag. If it was set, everything staged is dropped
    /// and true is returned.
    bool take_overflow() noexcept {
        if (!overflowed_.exchange(false, std::memory_order_acq_rel)) {
            return false;
        }
        read_.store(written_.load(std::memory_order_acquire), std::memory_order_release);
        return true;
    }

private:
    void take(std::span<T> out) noexcept {
        const auto read = read_.load(std::memory_order_relaxed);
        const std::size_t at = read & (capacity() - 1);
        const std::size_t head = std::min(out.size(), capacity() - at);
        std::copy_n(storage_.data() + at, head, out.data());
        std::copy_n(storage_.data(), out.size() - head, out.data() + head);

        read_.store(read + out.size(), std::memory_order_release);
    }

    // Separate cache lines for the producer and consumer counters
    static constexpr std::size_t kLine = 64;

    std::vector<T> storage_;
    alignas(kLine) std::atomic<std::size_t> written_{0};
    alignas(kLine) std::atomic<std::size_t> read_{0};
    std::atomic<bool> overflowed_{false};
};

}  // namespace loopcast
