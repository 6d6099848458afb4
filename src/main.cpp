// Entry point for loopcast: captures system audio and streams it to a remote
// visualizer as raw float32 UDP datagrams.
//
// Everything interesting lives in the library; this file wires configuration,
// logging, the device/endpoint choice and the optional status view together,
// and prints the device list when the operator has to pick one.

#include "loopcast/capture_loop.hpp"
#include "loopcast/config.hpp"
#include "loopcast/device_catalog.hpp"
#include "loopcast/endpoint_resolver.hpp"
#include "loopcast/logging.hpp"
#include "loopcast/portaudio_backend.hpp"
#include "loopcast/status_display.hpp"
#include "loopcast/streamer.hpp"

#include <boost/log/trivial.hpp>

#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CommandLine {
    std::optional<std::string> config_path;
    std::optional<int> device_index;
    std::optional<std::string> host;
    std::optional<int> port;
    bool list_devices = false;
    bool status_view = false;
    bool help = false;
};

void print_usage() {
    std::printf(
        "Usage: loopcast [options]\n"
        "  --config PATH     YAML configuration file (also LOOPCAST_CONFIG)\n"
        "  --device N        capture from device index N\n"
        "  --host ADDR       visualizer IPv4 address (skips discovery)\n"
        "  --port N          visualizer UDP port (default 12345)\n"
        "  --list-devices    list input devices with their scores and exit\n"
        "  --status-view     full-screen level meter (logs go to loopcast.log)\n"
        "  --help            show this help\n");
}

int parse_number(const char* flag, const char* text) {
    const std::size_t length = std::strlen(text);
    int value = 0;
    const auto [end, ec] = std::from_chars(text, text + length, value);
    if (ec != std::errc{} || end != text + length || length == 0) {
        throw loopcast::ConfigError(std::string(flag) + " expects a number, got '" + text + "'");
    }
    return value;
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    if (const char* path = std::getenv("LOOPCAST_CONFIG"); path != nullptr && *path != '\0') {
        cli.config_path = path;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto value = [&]() -> const char* {
            if (i + 1 >= argc) {
                throw loopcast::ConfigError(arg + " expects a value");
            }
            return argv[++i];
        };

        if (arg == "--config") {
            cli.config_path = value();
        } else if (arg == "--device") {
            cli.device_index = parse_number("--device", value());
        } else if (arg == "--host") {
            cli.host = value();
        } else if (arg == "--port") {
            cli.port = parse_number("--port", value());
        } else if (arg == "--list-devices") {
            cli.list_devices = true;
        } else if (arg == "--status-view") {
            cli.status_view = true;
        } else if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else {
            throw loopcast::ConfigError("Unknown option: " + arg);
        }
    }
    return cli;
}

loopcast::StreamerConfig build_config(const CommandLine& cli) {
    loopcast::StreamerConfig config =
        cli.config_path ? loopcast::load_config(*cli.config_path) : loopcast::StreamerConfig{};
    loopcast::apply_env_overrides(config);

    if (cli.device_index) config.device_index = cli.device_index;
    if (cli.host) config.network.fixed_host = cli.host;
    if (cli.port) {
        if (*cli.port < 1 || *cli.port > 65535) {
            throw loopcast::ConfigError("--port must be in 1..65535");
        }
        config.network.port = static_cast<std::uint16_t>(*cli.port);
    }
    if (cli.status_view) config.status_view = true;
    if (config.status_view && config.logging.file.empty()) {
        config.logging.file = "loopcast.log";
    }

    loopcast::validate(config);
    return config;
}

void print_devices(const std::vector<loopcast::DeviceDescriptor>& devices) {
    std::printf("Input devices:\n");
    for (const auto& device : devices) {
        const auto score = loopcast::score_device_name(device.name);
        std::printf("  %3d  %-48s %2d ch  %s\n", device.index, device.name.c_str(),
                    device.max_input_channels,
                    score ? ("score " + std::to_string(*score)).c_str() : "-");
    }
}

void report_failures(const loopcast::StartupResult& result) {
    for (const auto& failure : result.failures) {
        std::fprintf(stderr, "%s\n", failure.what());
        for (const auto& attempt : failure.attempts()) {
            std::fprintf(stderr, "    %u Hz, %u ch: %s\n", attempt.sample_rate_hz,
                         attempt.channel_count, attempt.reason.c_str());
        }
    }
}

// Signal handlers only reach the loop through this pointer.
loopcast::CaptureLoop* g_loop = nullptr;

void signal_handler(int /*signum*/) {
    if (g_loop != nullptr) {
        g_loop->request_stop();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::unique_ptr<loopcast::StatusDisplay> display;

    try {
        const CommandLine cli = parse_command_line(argc, argv);
        if (cli.help) {
            print_usage();
            return 0;
        }

        const loopcast::StreamerConfig config = build_config(cli);
        loopcast::init_logging(config.logging);

        auto backend = loopcast::make_capture_backend(loopcast::parse_backend_kind(config.backend));

        if (cli.list_devices) {
            print_devices(loopcast::list_devices(*backend));
            return 0;
        }

        const loopcast::EndpointResolver resolver{config.network};
        const loopcast::Resolution resolution = resolver.resolve();

        loopcast::StartupResult startup =
            loopcast::start_capture(*backend, config, resolution.endpoint);

        switch (startup.status) {
            case loopcast::StartupStatus::DeviceNotFound:
                std::fprintf(stderr,
                             "No system-audio capture device was found automatically.\n"
                             "Enable a loopback device such as \"Stereo Mix\", or pick one of "
                             "the devices below and run again with --device N.\n\n");
                print_devices(startup.devices);
                return 2;
            case loopcast::StartupStatus::NegotiationFailed:
                report_failures(startup);
                return 1;
            case loopcast::StartupStatus::Ready:
                break;
        }

        loopcast::CaptureLoop& loop = *startup.loop;
        g_loop = &loop;
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        if (config.status_view) {
            display = std::make_unique<loopcast::StatusDisplay>(startup.device, loop);
            loop.set_status_observer([&](const loopcast::CaptureStatus& status) {
                if (display->update(status)) {
                    loop.request_stop();
                }
            });
        } else {
            loop.set_status_observer([was_silent = true](const loopcast::CaptureStatus& status) mutable {
                if (status.state == loopcast::LoopState::Running && status.silent != was_silent) {
                    BOOST_LOG_TRIVIAL(info) << "[loopcast] "
                                            << (status.silent ? "Silence" : "Audio detected")
                                            << " (level " << status.activity_level << ")";
                    was_silent = status.silent;
                }
            });
        }

        BOOST_LOG_TRIVIAL(info) << "[loopcast] Streaming from " << startup.device.name
                                << ", Ctrl+C to stop";
        loop.run();

        g_loop = nullptr;
        display.reset();
        return 0;

    } catch (const std::exception& e) {
        // Restore the terminal before printing
        g_loop = nullptr;
        display.reset();
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
