#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace loopcast {

/// Snapshot of one host audio device, taken once per run.
struct DeviceDescriptor {
    int index = -1;
    std::string name;
    int max_input_channels = 0;
    int max_output_channels = 0;
};

/// Parameters for a single stream-open attempt. Samples are always 32-bit float.
struct StreamParams {
    std::uint32_t sample_rate = 44100;
    std::uint32_t channels = 1;
    std::size_t frame_size = 1024;  // Frames per buffer
};

enum class ReadStatus {
    Ok,        // samples_read samples were delivered (possibly a short read)
    Overflow,  // device or staging overflow; stale samples were discarded
    Timeout,   // nothing arrived before the deadline
    Failed     // stream is no longer delivering (device lost, host error)
};

/// Outcome of one CaptureStream::read call.
struct ReadResult {
    ReadStatus status = ReadStatus::Ok;
    std::size_t samples_read = 0;
    std::string error;  // Host error text for Failed
};

/// Thrown by CaptureBackend::open_stream when one configuration is rejected.
class StreamOpenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// An open, running capture stream. Destroying it stops and closes the stream.
class CaptureStream {
public:
    virtual ~CaptureStream() = default;

    /// Reads up to out.size() interleaved samples, waiting at most `timeout`.
    /// Never throws; every failure is reported through the result.
    virtual ReadResult read(std::span<float> out, std::chrono::milliseconds timeout) = 0;
};

/// Host audio subsystem seen through the handful of calls the streamer needs.
///
/// Two implementations exist: PortAudioBackend enumerates and opens devices
/// as the host reports them, LoopbackBackend additionally knows which input
/// mirrors the default output device. One is chosen at startup by
/// make_capture_backend().
class CaptureBackend {
public:
    virtual ~CaptureBackend() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Number of device slots; device_info() is valid for [0, device_count()).
    [[nodiscard]] virtual int device_count() const = 0;

    /// Returns nullopt when the device cannot be queried.
    [[nodiscard]] virtual std::optional<DeviceDescriptor> device_info(int index) const = 0;

    /// Device this backend would capture system audio from, if it knows one.
    [[nodiscard]] virtual std::optional<DeviceDescriptor> preferred_device() const {
        return std::nullopt;
    }

    /// Opens and starts a capture stream.
    /// @throws StreamOpenError if the host rejects the configuration.
    virtual std::unique_ptr<CaptureStream> open_stream(const DeviceDescriptor& device,
                                                       const StreamParams& params) = 0;
};

}  // namespace loopcast
