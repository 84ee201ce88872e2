#pragma once
#include "AudioTypes.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Blocking 16-bit interleaved input stream opened on one device.
// Owned by exactly one capture thread once started.
class IInputStream {
public:
    virtual ~IInputStream() = default;

    // Fill `out` with frameCount * channelCount samples. Blocks until the
    // device delivers them. Throws std::runtime_error on a read failure;
    // input overflow is not a failure.
    virtual void read(int16_t* out, int frameCount) = 0;

    virtual void close() = 0;
};

// Abstract host audio API.
// Implementations: PortAudioBackend (hardware), NullAudioBackend (none).
class IAudioBackend {
public:
    virtual ~IAudioBackend() = default;

    // Regular capture inputs (microphones, line-in)
    virtual std::vector<DeviceDescriptor> listInputDevices() const = 0;

    // Loopback/monitor captures of output devices. May throw when the host
    // API has no loopback support.
    virtual std::vector<DeviceDescriptor> listLoopbackDevices() const = 0;

    virtual std::optional<DeviceDescriptor> defaultInputDevice() const = 0;
    virtual std::optional<DeviceDescriptor> defaultOutputDevice() const = 0;
    virtual std::optional<DeviceDescriptor> deviceById(int id) const = 0;

    // Open at the device's native rate/channel count with the given
    // frames-per-read. Throws DeviceOpenError.
    virtual std::unique_ptr<IInputStream> openInput(const DeviceDescriptor& device,
                                                    int framesPerRead) = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};
