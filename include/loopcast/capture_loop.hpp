#pragma once

#include "loopcast/capture_backend.hpp"
#include "loopcast/frame_conditioner.hpp"
#include "loopcast/stream_negotiator.hpp"
#include "loopcast/transport_sender.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loopcast {

enum class LoopState { Running, Stopped };

/// Per-iteration failures. None of them is thrown.
enum class ErrorKind {
    ReadOverflow,    // device overflow; stale samples dropped
    ReadTimeout,     // no samples within the read timeout
    ReadFailed,      // the stream reported an error
    TransportFailed  // the datagram could not be sent
};

enum class LoopAction { Continue, Stop };

inline constexpr std::size_t kErrorKindCount = 4;

/// What the loop does after each kind of per-iteration failure. Transient I/O
/// never stops the loop; only request_stop() does.
inline constexpr std::array<LoopAction, kErrorKindCount> kErrorPolicy = {
    LoopAction::Continue,  // ReadOverflow
    LoopAction::Continue,  // ReadTimeout
    LoopAction::Continue,  // ReadFailed
    LoopAction::Continue,  // TransportFailed
};

[[nodiscard]] constexpr LoopAction action_for(ErrorKind kind) noexcept {
    return kErrorPolicy[static_cast<std::size_t>(kind)];
}

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Values the surrounding UI may display after every iteration.
struct CaptureStatus {
    LoopState state = LoopState::Running;
    float activity_level = 0.0f;  // Pre-gain peak of the last frame
    bool silent = true;
    std::optional<std::string> last_error;  // Error of the last iteration, if any

    std::uint64_t iterations = 0;
    std::uint64_t frames_sent = 0;
    std::uint64_t send_errors = 0;
    std::uint64_t read_errors = 0;
    std::uint64_t overflows = 0;
    std::uint64_t silent_streak = 0;  // Consecutive silent frames
};

struct LoopConfig {
    float gain = kDefaultGain;
    std::chrono::milliseconds read_timeout{500};
};

/// Everything one capture run owns: the negotiated stream, the socket and
/// the per-run conditioning state. Created once, released exactly once.
struct CaptureSession {
    CaptureSession(NegotiatedStream negotiated, const Endpoint& endpoint, const LoopConfig& config);

    StreamConfig config;
    std::unique_ptr<CaptureStream> stream;
    UdpSender sender;
    FrameConditioner conditioner;
    std::vector<float> raw;  // frame_size * channel_count samples
};

/// Drives read -> condition -> send until stopped.
///
/// Two states. Running is entered on construction, once a stream has been
/// negotiated; Stopped is entered only through request_stop(). Entering
/// Stopped releases the stream and the socket. Read and send failures are
/// mapped through kErrorPolicy, recorded in the status and otherwise ignored.
class CaptureLoop {
public:
    using StatusObserver = std::function<void(const CaptureStatus&)>;

    CaptureLoop(NegotiatedStream negotiated, const Endpoint& endpoint, const LoopConfig& config = {});

    /// Releases the session if still held.
    ~CaptureLoop();

    CaptureLoop(const CaptureLoop&) = delete;
    CaptureLoop& operator=(const CaptureLoop&) = delete;

    /// Runs iterations until a stop is requested. Returns in Stopped state.
    void run();

    /// Runs one iteration. Returns false once the loop is Stopped.
    bool step();

    /// Asks the loop to stop at the next iteration boundary.
    /// Async-signal-safe: only stores an atomic flag.
    void request_stop() noexcept { stop_requested_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] LoopState state() const noexcept { return status_.state; }
    [[nodiscard]] const CaptureStatus& status() const noexcept { return status_; }
    [[nodiscard]] const StreamConfig& stream_config() const noexcept { return stream_config_; }
    [[nodiscard]] const Endpoint& endpoint() const noexcept { return endpoint_; }

    /// False once Stopped: the stream and the socket have been released.
    [[nodiscard]] bool stream_open() const noexcept { return session_ && session_->stream; }
    [[nodiscard]] bool transport_open() const noexcept {
        return session_ && session_->sender.is_open();
    }

    /// Called on the loop thread after every iteration.
    void set_status_observer(StatusObserver observer) { observer_ = std::move(observer); }

private:
    /// Returns the action the error policy dictates.
    LoopAction record_error(ErrorKind kind, std::string detail);
    void transition_to_stopped();
    void publish();

    StreamConfig stream_config_;
    Endpoint endpoint_;
    std::unique_ptr<CaptureSession> session_;
    CaptureStatus status_;
    StatusObserver observer_;
    std::chrono::milliseconds read_timeout_;

    std::atomic<bool> stop_requested_{false};

    // Log throttling, one slot per ErrorKind
    std::array<std::chrono::steady_clock::time_point, kErrorKindCount> last_logged_{};
    std::array<std::uint64_t, kErrorKindCount> suppressed_{};
};

}  // namespace loopcast
