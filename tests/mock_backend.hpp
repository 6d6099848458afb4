#pragma once

#include "loopcast/capture_backend.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace loopcast::mock {

/// One scripted read: a status plus the samples to deliver for Ok.
struct ScriptedRead {
    ReadStatus status = ReadStatus::Ok;
    std::vector<float> samples;
    std::string error;
};

/// Capture stream that replays a script, then times out forever.
/// Increments a shared live-stream counter for its whole lifetime.
class MockStream final : public CaptureStream {
public:
    MockStream(std::shared_ptr<int> live, std::deque<ScriptedRead> script)
        : live_{std::move(live)}, script_{std::move(script)} {
        ++*live_;
    }

    ~MockStream() override { --*live_; }

    ReadResult read(std::span<float> out, std::chrono::milliseconds /*timeout*/) override {
        if (script_.empty()) {
            return ReadResult{.status = ReadStatus::Timeout};
        }

        ScriptedRead next = std::move(script_.front());
        script_.pop_front();

        if (next.status != ReadStatus::Ok) {
            return ReadResult{.status = next.status, .error = next.error};
        }

        const auto count = std::min(out.size(), next.samples.size());
        std::copy_n(next.samples.begin(), count, out.begin());
        return ReadResult{.status = ReadStatus::Ok, .samples_read = count};
    }

private:
    std::shared_ptr<int> live_;
    std::deque<ScriptedRead> script_;
};

/// In-memory host audio subsystem.
class MockBackend final : public CaptureBackend {
public:
    explicit MockBackend(std::vector<DeviceDescriptor> devices) : devices_{std::move(devices)} {}

    [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

    [[nodiscard]] int device_count() const override { return static_cast<int>(devices_.size()); }

    [[nodiscard]] std::optional<DeviceDescriptor> device_info(int index) const override {
        if (index < 0 || index >= device_count() || unqueryable_.contains(index)) {
            return std::nullopt;
        }
        return devices_[static_cast<std::size_t>(index)];
    }

    [[nodiscard]] std::optional<DeviceDescriptor> preferred_device() const override {
        return preferred_;
    }

    std::unique_ptr<CaptureStream> open_stream(const DeviceDescriptor& device,
                                               const StreamParams& params) override {
        opened_.push_back(std::make_pair(device.index, params));

        // Acquire first and release on rejection, like a host that must be
        // torn down after a failed configuration.
        auto stream = std::make_unique<MockStream>(live_, script_);
        if (rejected_devices_.contains(device.index) ||
            rejected_rates_.contains(params.sample_rate)) {
            throw StreamOpenError("Invalid sample rate " + std::to_string(params.sample_rate));
        }
        return stream;
    }

    void reject_rate(std::uint32_t rate) { rejected_rates_.insert(rate); }
    void reject_device(int index) { rejected_devices_.insert(index); }
    void make_unqueryable(int index) { unqueryable_.insert(index); }
    void set_preferred(DeviceDescriptor device) { preferred_ = std::move(device); }
    void set_script(std::deque<ScriptedRead> script) { script_ = std::move(script); }

    [[nodiscard]] int live_streams() const noexcept { return *live_; }
    [[nodiscard]] const std::vector<std::pair<int, StreamParams>>& opened() const noexcept {
        return opened_;
    }

private:
    std::vector<DeviceDescriptor> devices_;
    std::set<int> unqueryable_;
    std::set<int> rejected_devices_;
    std::set<std::uint32_t> rejected_rates_;
    std::optional<DeviceDescriptor> preferred_;
    std::deque<ScriptedRead> script_;

    std::shared_ptr<int> live_ = std::make_shared<int>(0);
    std::vector<std::pair<int, StreamParams>> opened_;
};

inline DeviceDescriptor make_device(int index, std::string name, int inputs, int outputs = 0) {
    return DeviceDescriptor{.index = index,
                            .name = std::move(name),
                            .max_input_channels = inputs,
                            .max_output_channels = outputs};
}

}  // namespace loopcast::mock
