#include "loopcast/endpoint_resolver.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/log/trivial.hpp>

#include <array>
#include <charconv>
#include <cstdio>
#include <sstream>
#include <utility>

namespace loopcast {

std::string_view to_string(EndpointSource source) noexcept {
    switch (source) {
        case EndpointSource::Fixed:
            return "fixed";
        case EndpointSource::PeerQuery:
            return "peer query";
        case EndpointSource::Scan:
            return "private-range scan";
        case EndpointSource::Loopback:
            return "loopback fallback";
    }
    return "unknown";
}

std::optional<boost::asio::ip::address_v4> parse_ipv4(std::string_view text) {
    boost::asio::ip::address_v4::bytes_type bytes{};
    const char* cursor = text.data();
    const char* const end = text.data() + text.size();

    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) {
            if (cursor == end || *cursor != '.') {
                return std::nullopt;
            }
            ++cursor;
        }
        // At most three digits per octet
        const char* const digits = cursor;
        unsigned octet = 0;
        const auto [next, ec] = std::from_chars(cursor, end, octet);
        if (ec != std::errc{} || next - digits > 3 || octet > 255) {
            return std::nullopt;
        }
        bytes[i] = static_cast<unsigned char>(octet);
        cursor = next;
    }

    if (cursor != end) {
        return std::nullopt;
    }
    return boost::asio::ip::address_v4{bytes};
}

EndpointResolver::EndpointResolver(ResolverConfig config)
    : EndpointResolver(std::move(config), &EndpointResolver::run_shell_command,
                       &EndpointResolver::udp_route_probe) {}

EndpointResolver::EndpointResolver(ResolverConfig config, CommandRunner run_command,
                                   RouteProbe probe_route)
    : config_{std::move(config)},
      run_command_{std::move(run_command)},
      probe_route_{std::move(probe_route)} {}

Resolution EndpointResolver::resolve() const {
    const auto make = [this](std::string host, EndpointSource source) {
        Resolution result{.endpoint = Endpoint{.host = std::move(host), .port = config_.port},
                          .source = source};
        BOOST_LOG_TRIVIAL(info) << "[EndpointResolver] Target " << result.endpoint.host << ":"
                                << result.endpoint.port << " (" << to_string(source) << ")";
        return result;
    };

    if (config_.fixed_host) {
        return make(*config_.fixed_host, EndpointSource::Fixed);
    }

    if (auto host = query_peer()) {
        return make(std::move(*host), EndpointSource::PeerQuery);
    }

    if (auto host = scan()) {
        BOOST_LOG_TRIVIAL(warning) << "[EndpointResolver] " << *host
                                   << " was guessed from a private-range scan; a local send "
                                      "succeeding does not mean a visualizer is listening";
        return make(std::move(*host), EndpointSource::Scan);
    }

    BOOST_LOG_TRIVIAL(warning) << "[EndpointResolver] Could not discover the visualizer, using "
                               << kLoopbackHost;
    return make(std::string(kLoopbackHost), EndpointSource::Loopback);
}

std::optional<std::string> EndpointResolver::query_peer() const {
    if (config_.peer_query_command.empty() || !run_command_) {
        return std::nullopt;
    }

    const auto output = run_command_(config_.peer_query_command);
    if (!output) {
        BOOST_LOG_TRIVIAL(debug) << "[EndpointResolver] '" << config_.peer_query_command
                                 << "' failed";
        return std::nullopt;
    }

    std::istringstream tokens{*output};
    std::string token;
    while (tokens >> token) {
        if (is_valid_ipv4(token)) {
            return token;
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "[EndpointResolver] '" << config_.peer_query_command
                             << "' printed no IPv4 address";
    return std::nullopt;
}

std::optional<std::string> EndpointResolver::scan() const {
    if (!config_.scan_private_ranges || !probe_route_) {
        return std::nullopt;
    }

    for (auto& candidate : scan_candidates()) {
        if (probe_route_(candidate, config_.port)) {
            return std::move(candidate);
        }
    }
    return std::nullopt;
}

std::vector<std::string> EndpointResolver::scan_candidates() {
    static constexpr std::array<std::string_view, 3> kPrefixes = {"172.28.", "172.29.", "172.30."};
    constexpr int kFirstOctet = 48;
    constexpr int kLastOctet = 79;

    std::vector<std::string> candidates;
    candidates.reserve(kPrefixes.size() * (kLastOctet - kFirstOctet + 1));

    for (const auto prefix : kPrefixes) {
        for (int octet = kFirstOctet; octet <= kLastOctet; ++octet) {
            candidates.push_back(std::string(prefix) + std::to_string(octet) + ".71");
        }
    }
    return candidates;
}

std::optional<std::string> EndpointResolver::run_shell_command(const std::string& command) {
    const std::string redirected = command + " 2>/dev/null";
    FILE* pipe = ::popen(redirected.c_str(), "r");
    if (pipe == nullptr) {
        return std::nullopt;
    }

    std::string output;
    std::array<char, 256> chunk{};
    while (std::fgets(chunk.data(), static_cast<int>(chunk.size()), pipe) != nullptr) {
        output += chunk.data();
    }

    if (::pclose(pipe) != 0) {
        return std::nullopt;
    }
    return output;
}

bool EndpointResolver::udp_route_probe(const std::string& host, std::uint16_t port) {
    namespace ip = boost::asio::ip;

    const auto address = parse_ipv4(host);
    if (!address) {
        return false;
    }

    boost::system::error_code ec;
    boost::asio::io_context io;
    ip::udp::socket socket{io};
    socket.open(ip::udp::v4(), ec);
    if (ec) {
        return false;
    }

    socket.send_to(boost::asio::const_buffer{}, ip::udp::endpoint{*address, port}, 0, ec);
    return !ec;
}

}  // namespace loopcast
