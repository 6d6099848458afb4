#pragma once

#include "loopcast/capture_backend.hpp"
#include "loopcast/capture_loop.hpp"

#include <chrono>

namespace loopcast {

/// Full-screen ncurses view of the capture status.
///
/// Shows a level meter for the pre-gain activity level, whether audio is
/// flowing, the stream and endpoint, transport counters and the last error.
/// It only reads CaptureStatus; pressing q asks the loop to stop.
class StatusDisplay {
public:
    StatusDisplay(const DeviceDescriptor& device, const CaptureLoop& loop);

    /// Restores the terminal.
    ~StatusDisplay();

    StatusDisplay(const StatusDisplay&) = delete;
    StatusDisplay& operator=(const StatusDisplay&) = delete;

    /// Redraws at most every 50 ms. Returns true if the user asked to quit.
    bool update(const CaptureStatus& status);

private:
    void render(const CaptureStatus& status);

    DeviceDescriptor device_;
    StreamConfig stream_config_;
    Endpoint endpoint_;

    bool has_color_ = false;
    int term_width_ = 0;
    int term_height_ = 0;
    std::chrono::steady_clock::time_point last_render_{};
};

}  // namespace loopcast
