#pragma once
#include "IAudioBackend.hpp"
#include "core/Errors.hpp"

// No devices at all. Used when PortAudio failed to initialise so the rest of
// the application (config, UI, --list-devices) still runs.
class NullAudioBackend : public IAudioBackend {
public:
    std::vector<DeviceDescriptor> listInputDevices() const override { return {}; }
    std::vector<DeviceDescriptor> listLoopbackDevices() const override { return {}; }
    std::optional<DeviceDescriptor> defaultInputDevice() const override { return std::nullopt; }
    std::optional<DeviceDescriptor> defaultOutputDevice() const override { return std::nullopt; }
    std::optional<DeviceDescriptor> deviceById(int) const override { return std::nullopt; }

    std::unique_ptr<IInputStream> openInput(const DeviceDescriptor& device, int) override {
        throw DeviceOpenError("No audio backend available to open '" +
                              device.displayName + "'");
    }

    std::string backendName() const override { return "null"; }
};
