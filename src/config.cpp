#include "loopcast/config.hpp"

#include "loopcast/portaudio_backend.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace loopcast {

namespace {

template <typename T>
std::optional<T> read_key(const YAML::Node& section, const char* key, std::string_view path) {
    const YAML::Node node = section[key];
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError("Config key '" + std::string(path) + "' has the wrong type");
    }
}

YAML::Node section_of(const YAML::Node& root, const char* name) {
    const YAML::Node section = root[name];
    if (section && !section.IsMap()) {
        throw ConfigError(std::string("Config section '") + name + "' must be a map");
    }
    return section;
}

std::uint16_t checked_port(long long value, std::string_view origin) {
    if (value < 1 || value > 65535) {
        throw ConfigError(std::string(origin) + ": port " + std::to_string(value) +
                          " is out of range");
    }
    return static_cast<std::uint16_t>(value);
}

int parse_int(std::string_view text, std::string_view origin) {
    int value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        throw ConfigError(std::string(origin) + ": '" + std::string(text) +
                          "' is not an integer");
    }
    return value;
}

float parse_float(const std::string& text, std::string_view origin) {
    char* end = nullptr;
    const float value = std::strtof(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        throw ConfigError(std::string(origin) + ": '" + text + "' is not a number");
    }
    return value;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

}  // namespace

void parse_config(const YAML::Node& root, StreamerConfig& config) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ConfigError("Config root must be a map");
    }

    if (const YAML::Node network = section_of(root, "network")) {
        if (auto host = read_key<std::string>(network, "host", "network.host")) {
            config.network.fixed_host = std::move(*host);
        }
        if (auto port = read_key<long long>(network, "port", "network.port")) {
            config.network.port = checked_port(*port, "network.port");
        }
        if (auto command =
                read_key<std::string>(network, "peer_query_command", "network.peer_query_command")) {
            config.network.peer_query_command = std::move(*command);
        }
        if (auto scan =
                read_key<bool>(network, "scan_private_ranges", "network.scan_private_ranges")) {
            config.network.scan_private_ranges = *scan;
        }
    }

    if (const YAML::Node audio = section_of(root, "audio")) {
        if (auto backend = read_key<std::string>(audio, "backend", "audio.backend")) {
            config.backend = std::move(*backend);
        }
        if (auto device = read_key<int>(audio, "device", "audio.device")) {
            config.device_index = *device;
        }
        if (auto channels = read_key<std::uint32_t>(audio, "channels", "audio.channels")) {
            config.preferred_channels = *channels;
        }
        if (auto gain = read_key<float>(audio, "gain", "audio.gain")) {
            config.gain = *gain;
        }
        if (auto timeout = read_key<long long>(audio, "read_timeout_ms", "audio.read_timeout_ms")) {
            config.read_timeout = std::chrono::milliseconds(*timeout);
        }
    }

    if (const YAML::Node logging = section_of(root, "logging")) {
        if (auto level = read_key<std::string>(logging, "level", "logging.level")) {
            config.logging.level = std::move(*level);
        }
        if (auto file = read_key<std::string>(logging, "file", "logging.file")) {
            config.logging.file = std::move(*file);
        }
    }

    if (const YAML::Node ui = section_of(root, "ui")) {
        if (auto status_view = read_key<bool>(ui, "status_view", "ui.status_view")) {
            config.status_view = *status_view;
        }
    }
}

StreamerConfig load_config(const std::string& path) {
    StreamerConfig config;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot load config '" + path + "': " + e.what());
    }
    parse_config(root, config);
    return config;
}

void apply_env_overrides(StreamerConfig& config) {
    if (const char* host = env("LOOPCAST_HOST")) {
        config.network.fixed_host = host;
    }
    if (const char* port = env("LOOPCAST_PORT")) {
        config.network.port = checked_port(parse_int(port, "LOOPCAST_PORT"), "LOOPCAST_PORT");
    }
    if (const char* device = env("LOOPCAST_DEVICE")) {
        config.device_index = parse_int(device, "LOOPCAST_DEVICE");
    }
    if (const char* gain = env("LOOPCAST_GAIN")) {
        config.gain = parse_float(gain, "LOOPCAST_GAIN");
    }
    if (const char* level = env("LOOPCAST_LOG_LEVEL")) {
        config.logging.level = level;
    }
}

void validate(const StreamerConfig& config) {
    if (!(config.gain >= kMinGain && config.gain <= kMaxGain)) {
        throw ConfigError("Gain " + std::to_string(config.gain) + " is outside [" +
                          std::to_string(kMinGain) + ", " + std::to_string(kMaxGain) + "]");
    }
    if (config.network.port == 0) {
        throw ConfigError("Port must be in 1..65535");
    }
    if (config.network.fixed_host && !is_valid_ipv4(*config.network.fixed_host)) {
        throw ConfigError("Host '" + *config.network.fixed_host +
                          "' is not an IPv4 address (names are not resolved)");
    }
    if (config.preferred_channels == 0) {
        throw ConfigError("Preferred channel count must be at least 1");
    }
    if (config.read_timeout.count() <= 0) {
        throw ConfigError("Read timeout must be positive");
    }
    if (config.device_index && *config.device_index < 0) {
        throw ConfigError("Device index must not be negative");
    }
    try {
        static_cast<void>(parse_backend_kind(config.backend));
        static_cast<void>(parse_severity(config.logging.level));
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

}  // namespace loopcast
