#include "loopcast/transport_sender.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

#include <bit>
#include <cstring>

namespace loopcast {

static_assert(sizeof(float) == sizeof(std::uint32_t), "binary32 floats required");

void encode_frame(std::span<const float> samples, std::vector<std::uint8_t>& out) {
    out.resize(samples.size() * sizeof(std::uint32_t));

    std::uint8_t* cursor = out.data();
    for (const float sample : samples) {
        const auto bits = boost::endian::native_to_little(std::bit_cast<std::uint32_t>(sample));
        std::memcpy(cursor, &bits, sizeof(bits));
        cursor += sizeof(bits);
    }
}

UdpSender::UdpSender(const Endpoint& endpoint)
    : endpoint_{endpoint}, socket_{io_, boost::asio::ip::udp::v4()} {
    if (const auto address = parse_ipv4(endpoint_.host)) {
        destination_.emplace(*address, endpoint_.port);
        BOOST_LOG_TRIVIAL(debug) << "[UdpSender] Socket open for " << endpoint_.host << ":"
                                 << endpoint_.port;
    } else {
        BOOST_LOG_TRIVIAL(warning) << "[UdpSender] '" << endpoint_.host
                                   << "' is not an IPv4 address; every send will fail";
    }
}

UdpSender::~UdpSender() {
    close();
}

boost::system::error_code UdpSender::send(std::span<const float> frame) {
    boost::system::error_code ec;
    if (!socket_.is_open()) {
        ++stats_.send_errors;
        return boost::asio::error::bad_descriptor;
    }
    if (!destination_) {
        ++stats_.send_errors;
        return boost::asio::error::invalid_argument;
    }

    encode_frame(frame, payload_);
    const std::size_t sent =
        socket_.send_to(boost::asio::buffer(payload_), *destination_, 0, ec);

    if (ec) {
        ++stats_.send_errors;
        return ec;
    }

    ++stats_.datagrams_sent;
    stats_.bytes_sent += sent;
    return ec;
}

void UdpSender::close() noexcept {
    if (socket_.is_open()) {
        boost::system::error_code ec;
        socket_.close(ec);
        BOOST_LOG_TRIVIAL(debug) << "[UdpSender] Socket closed";
    }
}

}  // namespace loopcast
