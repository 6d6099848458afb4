#pragma once

#include "loopcast/capture_loop.hpp"
#include "loopcast/endpoint_resolver.hpp"
#include "loopcast/frame_conditioner.hpp"
#include "loopcast/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace loopcast {

/// Malformed or unreadable configuration.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Complete streamer configuration.
///
/// Precedence, lowest to highest: defaults, YAML file, LOOPCAST_* environment
/// variables, command line.
///
/// Example file:
///
///   network:
///     host: 172.28.51.71      # omit to auto-discover
///     port: 12345
///     peer_query_command: "wsl hostname -I"
///     scan_private_ranges: true
///   audio:
///     backend: auto           # auto | standard | loopback
///     device: 3               # omit to auto-select
///     channels: 2
///     gain: 2.5
///     read_timeout_ms: 500
///   logging:
///     level: info
///     file: ""
///   ui:
///     status_view: false
struct StreamerConfig {
    ResolverConfig network;
    std::string backend = "auto";
    std::optional<int> device_index;
    std::uint32_t preferred_channels = 2;
    float gain = kDefaultGain;
    std::chrono::milliseconds read_timeout{500};
    LogConfig logging;
    bool status_view = false;

    [[nodiscard]] LoopConfig loop_config() const {
        return LoopConfig{.gain = gain, .read_timeout = read_timeout};
    }
};

/// Overlays the keys present in `root` onto `config`.
/// @throws ConfigError if a key has the wrong type.
void parse_config(const YAML::Node& root, StreamerConfig& config);

/// Defaults overlaid with the YAML file at `path`.
/// @throws ConfigError if the file cannot be read or parsed.
[[nodiscard]] StreamerConfig load_config(const std::string& path);

/// Applies LOOPCAST_HOST, LOOPCAST_PORT, LOOPCAST_DEVICE, LOOPCAST_GAIN and
/// LOOPCAST_LOG_LEVEL when set.
/// @throws ConfigError if a numeric variable does not parse.
void apply_env_overrides(StreamerConfig& config);

/// @throws ConfigError if a value is out of range.
void validate(const StreamerConfig& config);

}  // namespace loopcast
