#pragma once

#include <boost/asio/ip/address_v4.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loopcast {

inline constexpr std::uint16_t kDefaultPort = 12345;
inline constexpr std::string_view kLoopbackHost = "127.0.0.1";

/// Where the visualizer listens. Resolved once, immutable afterwards.
struct Endpoint {
    std::string host;
    std::uint16_t port = kDefaultPort;

    friend bool operator==(const Endpoint&, const Endpoint&) = default;
};

/// Which resolution step produced the endpoint.
enum class EndpointSource { Fixed, PeerQuery, Scan, Loopback };

[[nodiscard]] std::string_view to_string(EndpointSource source) noexcept;

struct Resolution {
    Endpoint endpoint;
    EndpointSource source = EndpointSource::Loopback;
};

struct ResolverConfig {
    std::optional<std::string> fixed_host;              // Used as-is when set
    std::uint16_t port = kDefaultPort;
    std::string peer_query_command = "wsl hostname -I";  // Empty disables the query
    bool scan_private_ranges = true;
};

/// Parses four dot-separated decimal octets, each in 0..255. Leading zeros
/// are read as decimal ("172.028.1.1" is 172.28.1.1), never as octal.
[[nodiscard]] std::optional<boost::asio::ip::address_v4> parse_ipv4(std::string_view text);

[[nodiscard]] inline bool is_valid_ipv4(std::string_view text) {
    return parse_ipv4(text).has_value();
}

/// Finds the receiver's address without user interaction.
///
/// Order, first success wins:
///   1. the configured fixed host, unvalidated;
///   2. the first valid IPv4 address printed by the peer query command;
///   3. the first private-range candidate a zero-length UDP send to does not
///      fail for. This only proves the address is locally routable, never
///      that a visualizer is listening;
///   4. 127.0.0.1.
///
/// Never throws for resolution failures. Given the same inputs the result is
/// the same.
class EndpointResolver {
public:
    /// Runs a shell command and returns its standard output, or nullopt if it
    /// could not be run or exited non-zero.
    using CommandRunner = std::function<std::optional<std::string>(const std::string&)>;

    /// Returns true if a datagram to host:port can be sent from here.
    using RouteProbe = std::function<bool(const std::string& host, std::uint16_t port)>;

    explicit EndpointResolver(ResolverConfig config);
    EndpointResolver(ResolverConfig config, CommandRunner run_command, RouteProbe probe_route);

    [[nodiscard]] Resolution resolve() const;

    /// 172.28.N.71, 172.29.N.71, 172.30.N.71 for N in 48..79.
    [[nodiscard]] static std::vector<std::string> scan_candidates();

    /// Default CommandRunner: popen() through the shell.
    [[nodiscard]] static std::optional<std::string> run_shell_command(const std::string& command);

    /// Default RouteProbe: zero-payload send_to on a fresh UDP socket.
    [[nodiscard]] static bool udp_route_probe(const std::string& host, std::uint16_t port);

private:
    [[nodiscard]] std::optional<std::string> query_peer() const;
    [[nodiscard]] std::optional<std::string> scan() const;

    ResolverConfig config_;
    CommandRunner run_command_;
    RouteProbe probe_route_;
};

}  // namespace loopcast
