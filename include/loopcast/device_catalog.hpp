#pragma once

#include "loopcast/capture_backend.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace loopcast {

/// A device ranked by how likely it is to carry system audio.
struct DeviceScore {
    DeviceDescriptor device;
    int score = 0;
};

/// Scores a device name against the system-audio keyword table
/// (case-insensitive). Returns nullopt when no keyword matches; such a device
/// is never auto-selected.
///
///   "stereo mix"                      100
///   "what u hear"                      90
///   "loopback"                         85
///   "wave out mix"                     80
///   "speakers" and "input"             70
///   "realtek" and ("stereo" or "mix")  60
///   "sound mapper"                     50
[[nodiscard]] std::optional<int> score_device_name(std::string_view name);

/// Enumerates input-capable devices in host index order. Devices the host
/// cannot describe are skipped.
[[nodiscard]] std::vector<DeviceDescriptor> list_devices(const CaptureBackend& backend);

/// Looks up one device by host index, regardless of its input capability.
[[nodiscard]] std::optional<DeviceDescriptor> find_device(const CaptureBackend& backend,
                                                          int index);

/// Keeps only keyword-matching devices, sorted by descending score with ties
/// going to the lower device index.
[[nodiscard]] std::vector<DeviceScore> score_devices(const std::vector<DeviceDescriptor>& devices);

/// Top-scored device, or nullopt (not found) when nothing matched. Not
/// finding a device is a normal outcome that calls for an operator choice.
[[nodiscard]] std::optional<DeviceDescriptor> select_device(
    const std::vector<DeviceScore>& scored);

}  // namespace loopcast
