#pragma once

#include "loopcast/endpoint_resolver.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace loopcast {

/// Encodes samples as consecutive little-endian IEEE-754 binary32 values.
/// This is the whole datagram payload: no header, length or sequence number.
void encode_frame(std::span<const float> samples, std::vector<std::uint8_t>& out);

/// Transport counters for status display.
struct TransportStats {
    std::uint64_t datagrams_sent = 0;
    std::uint64_t bytes_sent = 0;
    std::uint64_t send_errors = 0;
};

/// Fire-and-forget UDP sender: one frame, one datagram.
///
/// No acknowledgement, retransmission or ordering. A failed send is returned
/// to the caller and leaves the socket usable for the next frame.
class UdpSender {
public:
    /// Opens an IPv4 UDP socket aimed at `endpoint`. A host that is not an
    /// IPv4 address leaves the sender open, with every send() failing with
    /// invalid_argument.
    /// @throws boost::system::system_error if the socket cannot be created.
    explicit UdpSender(const Endpoint& endpoint);

    ~UdpSender();

    UdpSender(const UdpSender&) = delete;
    UdpSender& operator=(const UdpSender&) = delete;

    /// Sends one frame as one datagram. Never blocks on the receiver.
    boost::system::error_code send(std::span<const float> frame);

    /// Releases the socket. Later sends fail with bad_descriptor.
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return socket_.is_open(); }
    [[nodiscard]] bool has_destination() const noexcept { return destination_.has_value(); }
    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] const TransportStats& stats() const noexcept { return stats_; }

private:
    Endpoint endpoint_;
    boost::asio::io_context io_;
    std::optional<boost::asio::ip::udp::endpoint> destination_;  // Unset for a non-IPv4 host
    boost::asio::ip::udp::socket socket_;
    std::vector<std::uint8_t> payload_;
    TransportStats stats_;
};

}  // namespace loopcast
