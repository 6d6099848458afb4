#pragma once

#include "loopcast/capture_backend.hpp"
#include "loopcast/sample_staging.hpp"

#include <portaudio.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace loopcast {

/// RAII guard for PortAudio library initialization.
/// Pa_Initialize/Pa_Terminate run once no matter how many guards are alive.
class PortAudioGuard {
public:
    PortAudioGuard();
    ~PortAudioGuard();

    PortAudioGuard(const PortAudioGuard&) = delete;
    PortAudioGuard& operator=(const PortAudioGuard&) = delete;
};

/// Callback-driven PortAudio input stream.
///
/// The PortAudio callback runs in a real-time thread and only stages samples;
/// read() takes them from the capture loop through SampleStaging, with a
/// bounded wait so a stop request is never stuck behind a silent device.
class PortAudioStream final : public CaptureStream {
public:
    /// Ring depth in frames of frame_size samples per channel.
    static constexpr std::size_t kStagingFrames = 8;

    /// Opens and starts the stream.
    /// @throws StreamOpenError if PortAudio rejects the parameters.
    PortAudioStream(const DeviceDescriptor& device, const StreamParams& params);

    ~PortAudioStream() override;

    PortAudioStream(const PortAudioStream&) = delete;
    PortAudioStream& operator=(const PortAudioStream&) = delete;
    PortAudioStream(PortAudioStream&&) = delete;
    PortAudioStream& operator=(PortAudioStream&&) = delete;

    ReadResult read(std::span<float> out, std::chrono::milliseconds timeout) override;

    /// Number of callbacks that had to drop samples.
    [[nodiscard]] std::uint64_t overruns() const noexcept { return staging_.overruns(); }

private:
    static int audio_callback(const void* input, void* output, unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags, void* user_data);

    [[nodiscard]] std::optional<std::string> liveness() const;

    StreamParams params_;
    SampleStaging staging_;
    PaStream* stream_ = nullptr;
};

/// Plain PortAudio host: devices are listed and opened exactly as reported.
class PortAudioBackend : public CaptureBackend {
public:
    /// @throws std::runtime_error if PortAudio cannot be initialized.
    PortAudioBackend() = default;

    [[nodiscard]] std::string_view name() const noexcept override { return "portaudio"; }
    [[nodiscard]] int device_count() const override;
    [[nodiscard]] std::optional<DeviceDescriptor> device_info(int index) const override;

    std::unique_ptr<CaptureStream> open_stream(const DeviceDescriptor& device,
                                               const StreamParams& params) override;

private:
    PortAudioGuard guard_;
};

/// PortAudio host that exposes loopback inputs for output devices (WASAPI
/// loopback endpoints, "[Loopback]" devices). Prefers the input mirroring the
/// default output, which captures whatever the user currently hears.
class LoopbackBackend final : public PortAudioBackend {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "portaudio-loopback"; }
    [[nodiscard]] std::optional<DeviceDescriptor> preferred_device() const override;

    /// Runtime capability check: true if a loopback input for the default
    /// output device can be found on this host.
    [[nodiscard]] static bool probe();

private:
    [[nodiscard]] static std::optional<DeviceDescriptor> find_loopback_input();
};

enum class BackendKind { Auto, Standard, Loopback };

/// Parses "auto", "standard" or "loopback".
/// @throws std::invalid_argument for anything else.
[[nodiscard]] BackendKind parse_backend_kind(std::string_view text);

/// Chooses the capture backend once at startup. Auto selects the loopback
/// variant only if its probe succeeds.
[[nodiscard]] std::unique_ptr<CaptureBackend> make_capture_backend(BackendKind kind);

}  // namespace loopcast
