#pragma once

#include <boost/log/trivial.hpp>

#include <string>
#include <string_view>

namespace loopcast {

/// Logging sink and severity.
struct LogConfig {
    std::string level = "info";  // trace|debug|info|warning|error|fatal
    std::string file;            // Empty logs to stderr
};

/// @throws std::invalid_argument for an unknown level name.
[[nodiscard]] boost::log::trivial::severity_level parse_severity(std::string_view level);

/// Installs the Boost.Log sink and severity filter. Call once, before any
/// other component logs.
/// @throws std::invalid_argument for an unknown level name.
void init_logging(const LogConfig& config);

}  // namespace loopcast
