#include "loopcast/stream_negotiator.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <sstream>
#include <utility>

namespace loopcast {

namespace {

std::string describe_failure(const DeviceDescriptor& device,
                             const std::vector<NegotiationAttempt>& attempts) {
    std::ostringstream out;
    out << "No usable configuration for device " << device.index << " (" << device.name
        << "); tried";
    for (std::size_t i = 0; i < attempts.size(); ++i) {
        out << (i == 0 ? " " : ", ") << attempts[i].sample_rate_hz << " Hz";
    }
    return out.str();
}

}  // namespace

NegotiationError::NegotiationError(DeviceDescriptor device,
                                   std::vector<NegotiationAttempt> attempts)
    : std::runtime_error{describe_failure(device, attempts)},
      device_{std::move(device)},
      attempts_{std::move(attempts)} {}

std::uint32_t negotiated_channels(const DeviceDescriptor& device,
                                  std::uint32_t preferred_channels) noexcept {
    const auto available = static_cast<std::uint32_t>(std::max(device.max_input_channels, 0));
    return std::max<std::uint32_t>(1, std::min(preferred_channels, available));
}

NegotiatedStream negotiate_stream(CaptureBackend& backend, const DeviceDescriptor& device,
                                  std::uint32_t preferred_channels, std::size_t frame_size) {
    const std::uint32_t channels = negotiated_channels(device, preferred_channels);
    std::vector<NegotiationAttempt> attempts;

    for (const std::uint32_t rate : kCandidateSampleRates) {
        const StreamParams params{.sample_rate = rate, .channels = channels, .frame_size = frame_size};

        try {
            auto stream = backend.open_stream(device, params);
            BOOST_LOG_TRIVIAL(info) << "[StreamNegotiator] " << device.name << ": " << rate
                                    << " Hz, " << channels << " ch, " << frame_size
                                    << " frames per buffer";
            return NegotiatedStream{
                .config = StreamConfig{.sample_rate_hz = rate,
                                       .channel_count = channels,
                                       .frame_size = frame_size},
                .stream = std::move(stream)};
        } catch (const StreamOpenError& e) {
            BOOST_LOG_TRIVIAL(debug) << "[StreamNegotiator] " << rate << " Hz rejected: "
                                     << e.what();
            attempts.push_back(NegotiationAttempt{
                .sample_rate_hz = rate, .channel_count = channels, .reason = e.what()});
        }
    }

    throw NegotiationError{device, std::move(attempts)};
}

}  // namespace loopcast
