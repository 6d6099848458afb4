#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace loopcast {

/// Frames whose pre-gain peak magnitude is at or below this are silent.
inline constexpr float kSilenceThreshold = 0.001f;

/// Allowed range and default for the fixed per-run amplification.
inline constexpr float kMinGain = 2.0f;
inline constexpr float kMaxGain = 3.0f;
inline constexpr float kDefaultGain = 2.5f;

/// One frame ready for the wire: mono, exactly frame_size samples, amplified.
struct ConditionedFrame {
    std::vector<float> samples;
    float activity_level = 0.0f;  // Peak |sample| before gain
    bool silent = true;
};

/// Turns raw interleaved capture buffers into wire frames.
///
/// Steps, in order: downmix to mono by averaging channels, pad with zeros or
/// truncate to frame_size, measure the peak magnitude, then apply the gain.
/// Silence is judged on the pre-gain peak so the gain never changes it.
///
/// Buffers are allocated once at construction; condition() does not allocate.
class FrameConditioner {
public:
    /// @throws std::invalid_argument if frame_size or channel_count is zero or
    ///         gain is not positive.
    FrameConditioner(std::size_t frame_size, std::uint32_t channel_count, float gain);

    /// Conditions one raw buffer. The returned frame is overwritten by the
    /// next call.
    const ConditionedFrame& condition(std::span<const float> raw);

    [[nodiscard]] std::size_t frame_size() const noexcept { return frame_size_; }
    [[nodiscard]] std::uint32_t channel_count() const noexcept { return channel_count_; }
    [[nodiscard]] float gain() const noexcept { return gain_; }

private:
    std::size_t frame_size_;
    std::uint32_t channel_count_;
    float gain_;
    ConditionedFrame frame_;
};

/// Stateless form of FrameConditioner::condition.
[[nodiscard]] ConditionedFrame condition_frame(std::span<const float> raw,
                                               std::uint32_t channel_count,
                                               std::size_t frame_size, float gain);

}  // namespace loopcast
