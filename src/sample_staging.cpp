#include "loopcast/sample_staging.hpp"

#include <thread>
#include <utility>

namespace loopcast {

SampleStaging::SampleStaging(std::size_t capacity, LivenessCheck liveness)
    : ring_{capacity}, liveness_{std::move(liveness)} {}

void SampleStaging::stage(std::span<const float> samples, bool host_overflow) noexcept {
    if (host_overflow) {
        ring_.mark_overflow();
    }
    // A refused block flags the overflow inside the ring
    if (!ring_.push(samples) || host_overflow) {
        overruns_.fetch_add(1, std::memory_order_relaxed);
    }
}

ReadResult SampleStaging::read(std::span<float> out, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        if (ring_.take_overflow()) {
            return ReadResult{.status = ReadStatus::Overflow};
        }

        if (ring_.pop_frame(out)) {
            return ReadResult{.status = ReadStatus::Ok, .samples_read = out.size()};
        }

        if (liveness_) {
            if (auto failure = liveness_()) {
                std::this_thread::sleep_until(deadline);
                return ReadResult{.status = ReadStatus::Failed, .error = std::move(*failure)};
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            const std::size_t count = ring_.pop_available(out);
            if (count == 0) {
                return ReadResult{.status = ReadStatus::Timeout};
            }
            return ReadResult{.status = ReadStatus::Ok, .samples_read = count};
        }

        std::this_thread::sleep_for(kPollInterval);
    }
}

}  // namespace loopcast
