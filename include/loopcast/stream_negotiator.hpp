#pragma once

#include "loopcast/capture_backend.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace loopcast {

/// Samples per channel in every captured and transmitted frame.
inline constexpr std::size_t kFrameSize = 1024;

/// Sample rates tried in order of preference.
inline constexpr std::array<std::uint32_t, 4> kCandidateSampleRates = {44100, 48000, 22050,
                                                                       16000};

/// Stream format chosen by negotiation. Samples are 32-bit float; the format
/// is fixed for the lifetime of the stream.
struct StreamConfig {
    std::uint32_t sample_rate_hz = 44100;
    std::uint32_t channel_count = 1;
    std::size_t frame_size = kFrameSize;
};

/// An open stream together with the format it was opened with.
struct NegotiatedStream {
    StreamConfig config;
    std::unique_ptr<CaptureStream> stream;
};

/// One rejected configuration.
struct NegotiationAttempt {
    std::uint32_t sample_rate_hz = 0;
    std::uint32_t channel_count = 0;
    std::string reason;
};

/// No candidate configuration could be opened on a device. Fatal for that
/// device; the caller picks another device or gives up.
class NegotiationError : public std::runtime_error {
public:
    NegotiationError(DeviceDescriptor device, std::vector<NegotiationAttempt> attempts);

    [[nodiscard]] const DeviceDescriptor& device() const noexcept { return device_; }
    [[nodiscard]] const std::vector<NegotiationAttempt>& attempts() const noexcept {
        return attempts_;
    }

private:
    DeviceDescriptor device_;
    std::vector<NegotiationAttempt> attempts_;
};

/// Channel count used for a device: min(preferred, device inputs), at least 1.
[[nodiscard]] std::uint32_t negotiated_channels(const DeviceDescriptor& device,
                                                std::uint32_t preferred_channels) noexcept;

/// Opens a capture stream on `device`, trying kCandidateSampleRates in order.
/// A rejected attempt leaves nothing open behind it.
///
/// @throws NegotiationError naming the device and every attempted rate if all
///         candidates fail ("no usable configuration").
[[nodiscard]] NegotiatedStream negotiate_stream(CaptureBackend& backend,
                                                const DeviceDescriptor& device,
                                                std::uint32_t preferred_channels,
                                                std::size_t frame_size = kFrameSize);

}  // namespace loopcast
