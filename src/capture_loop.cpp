#include "loopcast/capture_loop.hpp"

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_feature.hpp>
#include <boost/log/trivial.hpp>

#include <utility>

namespace loopcast {

namespace {

constexpr auto kErrorLogInterval = std::chrono::seconds(1);

}  // namespace

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ReadOverflow:
            return "read overflow";
        case ErrorKind::ReadTimeout:
            return "read timeout";
        case ErrorKind::ReadFailed:
            return "read failed";
        case ErrorKind::TransportFailed:
            return "transport failed";
    }
    return "unknown";
}

CaptureSession::CaptureSession(NegotiatedStream negotiated, const Endpoint& endpoint,
                               const LoopConfig& loop_config)
    : config{negotiated.config},
      stream{std::move(negotiated.stream)},
      sender{endpoint},
      conditioner{config.frame_size, config.channel_count, loop_config.gain},
      raw(config.frame_size * config.channel_count, 0.0f) {}

CaptureLoop::CaptureLoop(NegotiatedStream negotiated, const Endpoint& endpoint,
                         const LoopConfig& config)
    : stream_config_{negotiated.config},
      endpoint_{endpoint},
      session_{std::make_unique<CaptureSession>(std::move(negotiated), endpoint, config)},
      read_timeout_{config.read_timeout} {
    BOOST_LOG_TRIVIAL(info) << "[CaptureLoop] Running: " << stream_config_.sample_rate_hz
                            << " Hz, " << stream_config_.channel_count << " ch -> "
                            << endpoint_.host << ":" << endpoint_.port << ", gain "
                            << session_->conditioner.gain();
}

CaptureLoop::~CaptureLoop() {
    if (session_) {
        transition_to_stopped();
    }
}

void CaptureLoop::run() {
    while (step()) {
    }
}

bool CaptureLoop::step() {
    if (status_.state == LoopState::Stopped) {
        return false;
    }

    if (stop_requested_.load(std::memory_order_relaxed)) {
        transition_to_stopped();
        publish();
        return false;
    }

    CaptureSession& session = *session_;
    ++status_.iterations;
    status_.last_error.reset();

    LoopAction action = LoopAction::Continue;
    const ReadResult read = session.stream->read(session.raw, read_timeout_);

    switch (read.status) {
        case ReadStatus::Ok: {
            const auto& frame = session.conditioner.condition(
                std::span<const float>{session.raw.data(), read.samples_read});

            status_.activity_level = frame.activity_level;
            status_.silent = frame.silent;
            status_.silent_streak = frame.silent ? status_.silent_streak + 1 : 0;

            if (const auto ec = session.sender.send(frame.samples)) {
                action = record_error(ErrorKind::TransportFailed,
                                      endpoint_.host + ":" + std::to_string(endpoint_.port) +
                                          ": " + ec.message());
            } else {
                ++status_.frames_sent;
            }
            break;
        }
        case ReadStatus::Overflow:
            action = record_error(ErrorKind::ReadOverflow, "Input overflow, stale samples dropped");
            break;
        case ReadStatus::Timeout:
            action = record_error(ErrorKind::ReadTimeout,
                                  "No audio within " + std::to_string(read_timeout_.count()) +
                                      " ms");
            break;
        case ReadStatus::Failed:
            action = record_error(ErrorKind::ReadFailed, read.error);
            break;
    }

    if (action == LoopAction::Stop) {
        transition_to_stopped();
    }

    publish();
    return status_.state == LoopState::Running;
}

LoopAction CaptureLoop::record_error(ErrorKind kind, std::string detail) {
    switch (kind) {
        case ErrorKind::ReadOverflow:
            ++status_.overflows;
            break;
        case ErrorKind::ReadTimeout:
        case ErrorKind::ReadFailed:
            ++status_.read_errors;
            break;
        case ErrorKind::TransportFailed:
            ++status_.send_errors;
            break;
    }

    const auto slot = static_cast<std::size_t>(kind);
    const auto now = std::chrono::steady_clock::now();
    if (now - last_logged_[slot] >= kErrorLogInterval) {
        const auto severity = (kind == ErrorKind::ReadOverflow || kind == ErrorKind::ReadTimeout)
                                  ? boost::log::trivial::debug
                                  : boost::log::trivial::warning;
        BOOST_LOG_SEV(boost::log::trivial::logger::get(), severity)
            << "[CaptureLoop] " << to_string(kind) << ": " << detail
            << (suppressed_[slot] > 0
                    ? " (" + std::to_string(suppressed_[slot]) + " similar suppressed)"
                    : std::string{});
        last_logged_[slot] = now;
        suppressed_[slot] = 0;
    } else {
        ++suppressed_[slot];
    }

    status_.last_error = std::move(detail);
    return action_for(kind);
}

void CaptureLoop::transition_to_stopped() {
    session_.reset();
    status_.state = LoopState::Stopped;
    BOOST_LOG_TRIVIAL(info) << "[CaptureLoop] Stopped after " << status_.iterations
                            << " iterations, " << status_.frames_sent << " frames sent";
}

void CaptureLoop::publish() {
    if (observer_) {
        observer_(status_);
    }
}

}  // namespace loopcast
