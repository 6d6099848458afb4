#include "loopcast/frame_conditioner.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace loopcast {

FrameConditioner::FrameConditioner(std::size_t frame_size, std::uint32_t channel_count,
                                   float gain)
    : frame_size_{frame_size}, channel_count_{channel_count}, gain_{gain} {
    if (frame_size_ == 0) {
        throw std::invalid_argument("Frame size must be positive");
    }
    if (channel_count_ == 0) {
        throw std::invalid_argument("Channel count must be positive");
    }
    if (!(gain_ > 0.0f)) {
        throw std::invalid_argument("Gain must be positive");
    }

    frame_.samples.resize(frame_size_);
}

const ConditionedFrame& FrameConditioner::condition(std::span<const float> raw) {
    auto& out = frame_.samples;

    // Downmix: arithmetic mean across channels at each position. A trailing
    // incomplete group of channels is dropped.
    const std::size_t positions = raw.size() / channel_count_;
    const std::size_t kept = std::min(positions, frame_size_);

    if (channel_count_ == 1) {
        std::copy_n(raw.begin(), kept, out.begin());
    } else {
        const float scale = 1.0f / static_cast<float>(channel_count_);
        for (std::size_t i = 0; i < kept; ++i) {
            const auto group = raw.subspan(i * channel_count_, channel_count_);
            float sum = 0.0f;
            for (const float sample : group) {
                sum += sample;
            }
            out[i] = sum * scale;
        }
    }

    // Short reads are padded at the tail; long ones were truncated above.
    std::fill(out.begin() + static_cast<std::ptrdiff_t>(kept), out.end(), 0.0f);

    float peak = 0.0f;
    for (const float sample : out) {
        peak = std::max(peak, std::abs(sample));
    }
    frame_.activity_level = peak;
    frame_.silent = peak <= kSilenceThreshold;

    for (float& sample : out) {
        sample *= gain_;
    }

    return frame_;
}

ConditionedFrame condition_frame(std::span<const float> raw, std::uint32_t channel_count,
                                 std::size_t frame_size, float gain) {
    FrameConditioner conditioner{frame_size, channel_count, gain};
    return conditioner.condition(raw);
}

}  // namespace loopcast
