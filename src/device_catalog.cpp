#include "loopcast/device_catalog.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace loopcast {

namespace {

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

}  // namespace

std::optional<int> score_device_name(std::string_view name) {
    const std::string lowered = to_lower(name);

    // Highest priority first; the first matching rule decides.
    if (contains(lowered, "stereo mix")) return 100;
    if (contains(lowered, "what u hear")) return 90;
    if (contains(lowered, "loopback")) return 85;
    if (contains(lowered, "wave out mix")) return 80;
    if (contains(lowered, "speakers") && contains(lowered, "input")) return 70;
    if (contains(lowered, "realtek") && (contains(lowered, "stereo") || contains(lowered, "mix"))) {
        return 60;
    }
    if (contains(lowered, "sound mapper")) return 50;

    return std::nullopt;
}

std::vector<DeviceDescriptor> list_devices(const CaptureBackend& backend) {
    std::vector<DeviceDescriptor> devices;

    const int count = backend.device_count();
    for (int i = 0; i < count; ++i) {
        auto info = backend.device_info(i);
        if (!info) {
            BOOST_LOG_TRIVIAL(debug) << "[DeviceCatalog] Skipping device " << i
                                     << ": cannot be queried";
            continue;
        }
        if (info->max_input_channels > 0) {
            devices.push_back(std::move(*info));
        }
    }

    return devices;
}

std::optional<DeviceDescriptor> find_device(const CaptureBackend& backend, int index) {
    if (index < 0 || index >= backend.device_count()) {
        return std::nullopt;
    }
    return backend.device_info(index);
}

std::vector<DeviceScore> score_devices(const std::vector<DeviceDescriptor>& devices) {
    std::vector<DeviceScore> scored;

    for (const auto& device : devices) {
        if (const auto score = score_device_name(device.name)) {
            scored.push_back(DeviceScore{.device = device, .score = *score});
        }
    }

    std::sort(scored.begin(), scored.end(), [](const DeviceScore& a, const DeviceScore& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.device.index < b.device.index;
    });

    return scored;
}

std::optional<DeviceDescriptor> select_device(const std::vector<DeviceScore>& scored) {
    if (scored.empty() || scored.front().score <= 0) {
        return std::nullopt;
    }
    return scored.front().device;
}

}  // namespace loopcast
