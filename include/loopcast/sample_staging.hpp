#pragma once

#include "loopcast/capture_backend.hpp"
#include "loopcast/ring_buffer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>

namespace loopcast {

/// Hands samples from a real-time capture callback to the capture loop.
///
/// The callback stages each host buffer with stage(); the loop takes one
/// frame per read() with a bounded wait. The audio host stays outside: the
/// owner supplies a liveness check instead.
///
/// read() outcomes:
///   Ok        a full frame, or a short read of what arrived by the deadline
///   Overflow  the host or the ring dropped samples; staged data is discarded
///   Timeout   nothing arrived by the deadline
///   Failed    the source stopped delivering; returned at the deadline so a
///             dead device does not turn the loop into a busy spin
class SampleStaging {
public:
    /// Returns nullopt while the source is live, otherwise why it is not.
    using LivenessCheck = std::function<std::optional<std::string>()>;

    static constexpr auto kPollInterval = std::chrono::milliseconds(2);

    SampleStaging(std::size_t capacity, LivenessCheck liveness);

    SampleStaging(const SampleStaging&) = delete;
    SampleStaging& operator=(const SampleStaging&) = delete;

    /// Producer side: never blocks or allocates. `host_overflow` reports that
    /// the host lost input before this block.
    void stage(std::span<const float> samples, bool host_overflow) noexcept;

    /// Consumer side. Waits at most `timeout`.
    ReadResult read(std::span<float> out, std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t capacity() const noexcept { return ring_.capacity(); }

    /// Blocks that arrived after, or carried, a loss of samples.
    [[nodiscard]] std::uint64_t overruns() const noexcept {
        return overruns_.load(std::memory_order_relaxed);
    }

private:
    RingBuffer<float> ring_;
    LivenessCheck liveness_;
    std::atomic<std::uint64_t> overruns_{0};
};

}  // namespace loopcast
