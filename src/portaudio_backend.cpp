#include "loopcast/portaudio_backend.hpp"

#include <boost/log/trivial.hpp>

#include <portaudio.h>

#include <mutex>
#include <stdexcept>
#include <string>

namespace loopcast {

namespace {

// Pa_Initialize and Pa_Terminate must not race; the count spans all backends.
std::mutex g_portaudio_mutex;
int g_portaudio_users = 0;

constexpr std::string_view kLoopbackSuffix = "[Loopback]";

DeviceDescriptor describe(int index, const PaDeviceInfo& info) {
    return DeviceDescriptor{.index = index,
                            .name = info.name != nullptr ? info.name : "",
                            .max_input_channels = info.maxInputChannels,
                            .max_output_channels = info.maxOutputChannels};
}

}  // namespace

PortAudioGuard::PortAudioGuard() {
    const std::lock_guard lock{g_portaudio_mutex};
    if (g_portaudio_users == 0) {
        if (const PaError err = Pa_Initialize(); err != paNoError) {
            throw std::runtime_error(std::string("Failed to initialize PortAudio: ") +
                                     Pa_GetErrorText(err));
        }
        BOOST_LOG_TRIVIAL(debug) << "[PortAudio] Initialized";
    }
    ++g_portaudio_users;
}

PortAudioGuard::~PortAudioGuard() {
    const std::lock_guard lock{g_portaudio_mutex};
    if (--g_portaudio_users == 0) {
        Pa_Terminate();
        BOOST_LOG_TRIVIAL(debug) << "[PortAudio] Terminated";
    }
}

// -----------------------------------------------------------------------------
// PortAudioStream
// -----------------------------------------------------------------------------

PortAudioStream::PortAudioStream(const DeviceDescriptor& device, const StreamParams& params)
    : params_{params},
      staging_{params.frame_size * params.channels * kStagingFrames, [this] { return liveness(); }} {
    const PaDeviceInfo* device_info = Pa_GetDeviceInfo(device.index);
    if (device_info == nullptr) {
        throw StreamOpenError("Device " + std::to_string(device.index) + " is not available");
    }

    PaStreamParameters input_params{};
    input_params.device = device.index;
    input_params.channelCount = static_cast<int>(params_.channels);
    input_params.sampleFormat = paFloat32;
    input_params.suggestedLatency = device_info->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(&stream_, &input_params,
                                nullptr,  // No output
                                static_cast<double>(params_.sample_rate),
                                static_cast<unsigned long>(params_.frame_size),
                                paClipOff,  // Don't clip samples
                                &PortAudioStream::audio_callback, this);
    if (err != paNoError) {
        stream_ = nullptr;
        throw StreamOpenError(std::string("Failed to open audio stream: ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        // The destructor does not run for a throwing constructor.
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        throw StreamOpenError(std::string("Failed to start audio stream: ") +
                              Pa_GetErrorText(err));
    }

    BOOST_LOG_TRIVIAL(debug) << "[PortAudioStream] Opened device " << device.index << " at "
                             << params_.sample_rate << " Hz, " << params_.channels << " ch";
}

PortAudioStream::~PortAudioStream() {
    if (stream_ != nullptr) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        BOOST_LOG_TRIVIAL(debug) << "[PortAudioStream] Closed";
    }
}

int PortAudioStream::audio_callback(const void* input, void* /*output*/,
                                    unsigned long frame_count,
                                    const PaStreamCallbackTimeInfo* /*time_info*/,
                                    PaStreamCallbackFlags status_flags, void* user_data) {
    auto* self = static_cast<PortAudioStream*>(user_data);
    const bool host_overflow = (status_flags & paInputOverflow) != 0;

    if (input == nullptr) {
        if (host_overflow) {
            self->staging_.stage({}, true);
        }
        return paContinue;
    }

    const std::span<const float> block{static_cast<const float*>(input),
                                       frame_count * self->params_.channels};
    self->staging_.stage(block, host_overflow);
    return paContinue;
}

std::optional<std::string> PortAudioStream::liveness() const {
    const PaError active = Pa_IsStreamActive(stream_);
    if (active == 1) {
        return std::nullopt;
    }
    if (active < 0) {
        return std::string(Pa_GetErrorText(active));
    }
    return std::string("Audio stream is no longer active");
}

ReadResult PortAudioStream::read(std::span<float> out, std::chrono::milliseconds timeout) {
    return staging_.read(out, timeout);
}

// -----------------------------------------------------------------------------
// PortAudioBackend
// -----------------------------------------------------------------------------

int PortAudioBackend::device_count() const {
    const int count = Pa_GetDeviceCount();
    if (count < 0) {
        BOOST_LOG_TRIVIAL(error) << "[PortAudioBackend] Failed to enumerate devices: "
                                 << Pa_GetErrorText(count);
        return 0;
    }
    return count;
}

std::optional<DeviceDescriptor> PortAudioBackend::device_info(int index) const {
    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (info == nullptr) {
        return std::nullopt;
    }
    return describe(index, *info);
}

std::unique_ptr<CaptureStream> PortAudioBackend::open_stream(const DeviceDescriptor& device,
                                                             const StreamParams& params) {
    return std::make_unique<PortAudioStream>(device, params);
}

// -----------------------------------------------------------------------------
// LoopbackBackend
// -----------------------------------------------------------------------------

std::optional<DeviceDescriptor> LoopbackBackend::preferred_device() const {
    return find_loopback_input();
}

bool LoopbackBackend::probe() {
    try {
        PortAudioGuard guard;
        return find_loopback_input().has_value();
    } catch (const std::runtime_error& e) {
        BOOST_LOG_TRIVIAL(warning) << "[LoopbackBackend] Probe failed: " << e.what();
        return false;
    }
}

std::optional<DeviceDescriptor> LoopbackBackend::find_loopback_input() {
    const PaDeviceIndex output = Pa_GetDefaultOutputDevice();
    if (output == paNoDevice) {
        return std::nullopt;
    }

    const PaDeviceInfo* output_info = Pa_GetDeviceInfo(output);
    if (output_info == nullptr || output_info->name == nullptr) {
        return std::nullopt;
    }
    const std::string_view output_name{output_info->name};

    const int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        if (i == output) {
            continue;  // A duplex device's own input is a microphone, not a loopback
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info == nullptr || info->name == nullptr || info->maxInputChannels <= 0) {
            continue;
        }

        const std::string_view name{info->name};
        if (!name.starts_with(output_name)) {
            continue;
        }
        if (name.size() == output_name.size() ||
            name.find(kLoopbackSuffix, output_name.size()) != std::string_view::npos) {
            return describe(i, *info);
        }
    }

    return std::nullopt;
}

// -----------------------------------------------------------------------------
// Backend selection
// -----------------------------------------------------------------------------

BackendKind parse_backend_kind(std::string_view text) {
    if (text == "auto") return BackendKind::Auto;
    if (text == "standard") return BackendKind::Standard;
    if (text == "loopback") return BackendKind::Loopback;
    throw std::invalid_argument("Unknown capture backend: " + std::string(text));
}

std::unique_ptr<CaptureBackend> make_capture_backend(BackendKind kind) {
    std::unique_ptr<CaptureBackend> backend;

    switch (kind) {
        case BackendKind::Standard:
            backend = std::make_unique<PortAudioBackend>();
            break;
        case BackendKind::Loopback:
            backend = std::make_unique<LoopbackBackend>();
            break;
        case BackendKind::Auto:
            if (LoopbackBackend::probe()) {
                backend = std::make_unique<LoopbackBackend>();
            } else {
                backend = std::make_unique<PortAudioBackend>();
            }
            break;
    }

    BOOST_LOG_TRIVIAL(info) << "[CaptureBackend] Using " << backend->name() << " ("
                            << Pa_GetVersionText() << ")";
    return backend;
}

}  // namespace loopcast
