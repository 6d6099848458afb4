#include "loopcast/streamer.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>

namespace loopcast {

namespace {

bool try_device(CaptureBackend& backend, const DeviceDescriptor& device,
                const StreamerConfig& config, const Endpoint& endpoint, StartupResult& result) {
    BOOST_LOG_TRIVIAL(info) << "[Streamer] Trying device " << device.index << ": " << device.name;
    try {
        auto negotiated = negotiate_stream(backend, device, config.preferred_channels);
        result.loop =
            std::make_unique<CaptureLoop>(std::move(negotiated), endpoint, config.loop_config());
        result.device = device;
        result.status = StartupStatus::Ready;
        return true;
    } catch (const NegotiationError& e) {
        BOOST_LOG_TRIVIAL(warning) << "[Streamer] " << e.what();
        result.failures.push_back(e);
        return false;
    }
}

}  // namespace

StartupResult start_capture(CaptureBackend& backend, const StreamerConfig& config,
                            const Endpoint& endpoint) {
    StartupResult result;
    result.devices = list_devices(backend);
    result.scored = score_devices(result.devices);

    if (config.device_index) {
        const auto device = find_device(backend, *config.device_index);
        if (!device) {
            BOOST_LOG_TRIVIAL(error) << "[Streamer] Device " << *config.device_index
                                     << " does not exist";
            result.status = StartupStatus::DeviceNotFound;
            return result;
        }
        if (!try_device(backend, *device, config, endpoint, result)) {
            result.status = StartupStatus::NegotiationFailed;
        }
        return result;
    }

    std::vector<DeviceDescriptor> order;
    if (auto preferred = backend.preferred_device()) {
        BOOST_LOG_TRIVIAL(info) << "[Streamer] " << backend.name() << " prefers "
                                << preferred->name;
        order.push_back(std::move(*preferred));
    }
    for (const auto& candidate : result.scored) {
        const bool already = std::any_of(order.begin(), order.end(), [&](const auto& d) {
            return d.index == candidate.device.index;
        });
        if (!already) {
            order.push_back(candidate.device);
        }
    }

    if (order.empty()) {
        BOOST_LOG_TRIVIAL(warning) << "[Streamer] No system-audio device found among "
                                   << result.devices.size() << " input devices";
        result.status = StartupStatus::DeviceNotFound;
        return result;
    }

    for (const auto& device : order) {
        if (try_device(backend, device, config, endpoint, result)) {
            return result;
        }
    }

    result.status = StartupStatus::NegotiationFailed;
    return result;
}

}  // namespace loopcast
