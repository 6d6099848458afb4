#pragma once

#include "loopcast/capture_backend.hpp"
#include "loopcast/capture_loop.hpp"
#include "loopcast/config.hpp"
#include "loopcast/device_catalog.hpp"
#include "loopcast/endpoint_resolver.hpp"
#include "loopcast/stream_negotiator.hpp"

#include <memory>
#include <vector>

namespace loopcast {

enum class StartupStatus {
    Ready,              // loop is Running
    DeviceNotFound,     // no device could be chosen without the operator
    NegotiationFailed   // every chosen device rejected every configuration
};

struct StartupResult {
    StartupStatus status = StartupStatus::DeviceNotFound;
    std::unique_ptr<CaptureLoop> loop;

    /// Device the loop captures from (Ready).
    DeviceDescriptor device;

    /// Input-capable devices and their scores, for a manual choice.
    std::vector<DeviceDescriptor> devices;
    std::vector<DeviceScore> scored;

    /// One entry per device that failed negotiation, in the order tried.
    std::vector<NegotiationError> failures;
};

/// Chooses a device and opens the capture loop.
///
/// Device order: the explicit config.device_index if set (no fallback), else
/// the backend's preferred loopback device, then every scored candidate from
/// the highest score down. A device that fails negotiation is skipped in
/// favour of the next one. Does not throw for a missing device or failed
/// negotiation; both are reported in the result.
[[nodiscard]] StartupResult start_capture(CaptureBackend& backend, const StreamerConfig& config,
                                          const Endpoint& endpoint);

}  // namespace loopcast
