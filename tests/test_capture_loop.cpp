#include "loopcast/capture_loop.hpp"

#include "mock_backend.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>

#include <gtest/gtest.h>

#include <bit>
#include <cstdint>
#include <cstring>
#include <deque>
#include <filesystem>
#include <iterator>
#include <vector>

namespace loopcast {
namespace {

namespace ip = boost::asio::ip;

using mock::MockBackend;
using mock::ScriptedRead;
using mock::make_device;

class CaptureLoopTest : public ::testing::Test {
protected:
    static constexpr std::size_t kFrame = 4;

    CaptureLoopTest() : receiver_{io_, ip::udp::endpoint{ip::address_v4::loopback(), 0}} {}

    std::unique_ptr<CaptureLoop> make_loop(std::deque<ScriptedRead> script,
                                           std::optional<Endpoint> endpoint = std::nullopt) {
        backend_.set_script(std::move(script));
        auto negotiated = negotiate_stream(backend_, device_, 2, kFrame);
        return std::make_unique<CaptureLoop>(std::move(negotiated),
                                             endpoint.value_or(receiver_endpoint()),
                                             LoopConfig{.gain = 2.0f});
    }

    Endpoint receiver_endpoint() const {
        return Endpoint{.host = "127.0.0.1", .port = receiver_.local_endpoint().port()};
    }

    std::vector<float> receive_frame() {
        std::vector<std::uint8_t> datagram(65536);
        ip::udp::endpoint sender;
        datagram.resize(receiver_.receive_from(boost::asio::buffer(datagram), sender));

        std::vector<float> samples(datagram.size() / sizeof(float));
        for (std::size_t i = 0; i < samples.size(); ++i) {
            std::uint32_t bits = 0;
            std::memcpy(&bits, datagram.data() + i * sizeof(bits), sizeof(bits));
            samples[i] = std::bit_cast<float>(bits);  // Test hosts are little-endian
        }
        return samples;
    }

    static std::size_t open_descriptors() {
        const std::filesystem::directory_iterator entries{"/proc/self/fd"};
        return static_cast<std::size_t>(
            std::distance(std::filesystem::begin(entries), std::filesystem::end(entries)));
    }

    DeviceDescriptor device_ = make_device(0, "Stereo Mix (Realtek Audio)", 2);
    MockBackend backend_{{device_}};
    boost::asio::io_context io_;
    ip::udp::socket receiver_;
};

TEST_F(CaptureLoopTest, StartsRunningWithNegotiatedFormat) {
    auto loop = make_loop({});

    EXPECT_EQ(loop->state(), LoopState::Running);
    EXPECT_EQ(loop->stream_config().sample_rate_hz, 44100);
    EXPECT_EQ(loop->stream_config().channel_count, 2);
    EXPECT_EQ(loop->endpoint(), receiver_endpoint());
    EXPECT_EQ(backend_.live_streams(), 1);
}

TEST_F(CaptureLoopTest, SendsConditionedFrame) {
    auto loop = make_loop({ScriptedRead{.samples = {0.5f, 0.5f, -0.2f, -0.2f, 0.1f, 0.3f, 0.0f, 0.0f}}});

    ASSERT_TRUE(loop->step());

    const auto frame = receive_frame();
    ASSERT_EQ(frame.size(), kFrame);
    EXPECT_FLOAT_EQ(frame[0], 1.0f);
    EXPECT_FLOAT_EQ(frame[1], -0.4f);
    EXPECT_NEAR(frame[2], 0.4f, 1e-6f);
    EXPECT_FLOAT_EQ(frame[3], 0.0f);

    const auto& status = loop->status();
    EXPECT_FLOAT_EQ(status.activity_level, 0.5f);
    EXPECT_FALSE(status.silent);
    EXPECT_EQ(status.frames_sent, 1);
    EXPECT_FALSE(status.last_error.has_value());
}

TEST_F(CaptureLoopTest, ShortReadIsPaddedToFullFrame) {
    auto loop = make_loop({ScriptedRead{.samples = {0.25f, 0.25f}}});

    ASSERT_TRUE(loop->step());

    const auto frame = receive_frame();
    ASSERT_EQ(frame.size(), kFrame);
    EXPECT_FLOAT_EQ(frame[0], 0.5f);
    EXPECT_FLOAT_EQ(frame[1], 0.0f);
    EXPECT_FLOAT_EQ(frame[3], 0.0f);
}

TEST_F(CaptureLoopTest, SilentFramesAreStillSent) {
    auto loop = make_loop({ScriptedRead{.samples = std::vector<float>(kFrame * 2, 0.0f)},
                           ScriptedRead{.samples = std::vector<float>(kFrame * 2, 0.0f)}});

    loop->step();
    loop->step();

    EXPECT_TRUE(loop->status().silent);
    EXPECT_EQ(loop->status().silent_streak, 2);
    EXPECT_EQ(loop->status().frames_sent, 2);
    EXPECT_EQ(receive_frame().size(), kFrame);
}

TEST_F(CaptureLoopTest, ReadErrorsAreRecordedAndLoopContinues) {
    auto loop = make_loop({
        ScriptedRead{.status = ReadStatus::Overflow},
        ScriptedRead{.status = ReadStatus::Timeout},
        ScriptedRead{.status = ReadStatus::Failed, .error = "Unanticipated host error"},
        ScriptedRead{.samples = std::vector<float>(kFrame * 2, 0.1f)},
    });

    EXPECT_TRUE(loop->step());
    EXPECT_EQ(loop->status().overflows, 1);
    EXPECT_TRUE(loop->status().last_error.has_value());

    EXPECT_TRUE(loop->step());
    EXPECT_EQ(loop->status().read_errors, 1);

    EXPECT_TRUE(loop->step());
    EXPECT_EQ(loop->status().read_errors, 2);
    EXPECT_EQ(loop->status().last_error, "Unanticipated host error");

    EXPECT_TRUE(loop->step());
    EXPECT_EQ(loop->status().frames_sent, 1);
    EXPECT_FALSE(loop->status().last_error.has_value());  // Cleared by a good iteration

    EXPECT_EQ(loop->state(), LoopState::Running);
    EXPECT_EQ(loop->status().iterations, 4);
}

TEST_F(CaptureLoopTest, TransportFailureDoesNotStopLoop) {
    auto loop = make_loop(
        {ScriptedRead{.samples = std::vector<float>(kFrame * 2, 0.1f)},
         ScriptedRead{.samples = std::vector<float>(kFrame * 2, 0.1f)}},
        Endpoint{.host = "255.255.255.255", .port = 9});

    EXPECT_TRUE(loop->step());
    EXPECT_TRUE(loop->step());

    EXPECT_EQ(loop->state(), LoopState::Running);
    EXPECT_EQ(loop->status().send_errors, 2);
    EXPECT_EQ(loop->status().frames_sent, 0);
    EXPECT_TRUE(loop->status().last_error.has_value());
}

TEST_F(CaptureLoopTest, ErrorPolicyNeverStops) {
    for (const auto kind : {ErrorKind::ReadOverflow, ErrorKind::ReadTimeout,
                            ErrorKind::ReadFailed, ErrorKind::TransportFailed}) {
        EXPECT_EQ(action_for(kind), LoopAction::Continue) << to_string(kind);
    }
}

TEST_F(CaptureLoopTest, StopRequestReleasesStream) {
    const auto fds_before = open_descriptors();
    auto loop = make_loop({});
    ASSERT_EQ(backend_.live_streams(), 1);
    ASSERT_TRUE(loop->stream_open());
    ASSERT_TRUE(loop->transport_open());
    EXPECT_GT(open_descriptors(), fds_before);

    loop->request_stop();
    EXPECT_FALSE(loop->step());
    EXPECT_EQ(loop->state(), LoopState::Stopped);
    EXPECT_EQ(backend_.live_streams(), 0);
    EXPECT_FALSE(loop->stream_open());
    EXPECT_FALSE(loop->transport_open());
    EXPECT_EQ(open_descriptors(), fds_before);  // Socket closed, not just flagged

    // Stopped is terminal
    EXPECT_FALSE(loop->step());
    EXPECT_EQ(loop->state(), LoopState::Stopped);
}

TEST_F(CaptureLoopTest, RunReturnsAfterObserverRequestsStop) {
    auto loop = make_loop({ScriptedRead{.samples = std::vector<float>(kFrame * 2, 0.2f)},
                           ScriptedRead{.status = ReadStatus::Timeout},
                           ScriptedRead{.samples = std::vector<float>(kFrame * 2, 0.2f)}});

    std::vector<LoopState> seen;
    loop->set_status_observer([&](const CaptureStatus& status) {
        seen.push_back(status.state);
        if (status.iterations == 3) {
            loop->request_stop();
        }
    });

    loop->run();

    EXPECT_EQ(loop->state(), LoopState::Stopped);
    EXPECT_EQ(loop->status().iterations, 3);
    EXPECT_EQ(loop->status().frames_sent, 2);
    ASSERT_EQ(seen.size(), 4);  // Three iterations, then the stop
    EXPECT_EQ(seen.back(), LoopState::Stopped);
    EXPECT_EQ(backend_.live_streams(), 0);
}

TEST_F(CaptureLoopTest, DestroyingRunningLoopReleasesStream) {
    const auto fds_before = open_descriptors();
    {
        auto loop = make_loop({});
        EXPECT_EQ(backend_.live_streams(), 1);
        EXPECT_TRUE(loop->transport_open());
        EXPECT_GT(open_descriptors(), fds_before);
    }
    EXPECT_EQ(backend_.live_streams(), 0);
    EXPECT_EQ(open_descriptors(), fds_before);
}

}  // namespace
}  // namespace loopcast
