#pragma once
#include "IAudioBackend.hpp"
#include <memory>
#include <string>
#include <vector>

// PortAudio host backend. Supports WASAPI (Windows), Core Audio (macOS),
// ALSA/PulseAudio (Linux). Link with -lportaudio.
//
// Capture uses PortAudio's blocking read API (Pa_ReadStream, paInt16) so the
// per-channel capture thread owns the stream outright: no callback thread,
// no ring buffer between them.
//
// Loopback devices are the inputs a host API publishes as monitors of an
// output ("Monitor of ..." on PulseAudio, "[Loopback]" on patched WASAPI
// builds). They are listed separately from microphones.
class PortAudioBackend : public IAudioBackend {
public:
    PortAudioBackend();
    ~PortAudioBackend() override;

    PortAudioBackend(const PortAudioBackend&) = delete;
    PortAudioBackend& operator=(const PortAudioBackend&) = delete;

    std::vector<DeviceDescriptor> listInputDevices() const override;
    std::vector<DeviceDescriptor> listLoopbackDevices() const override;

    std::optional<DeviceDescriptor> defaultInputDevice() const override;
    std::optional<DeviceDescriptor> defaultOutputDevice() const override;
    std::optional<DeviceDescriptor> deviceById(int id) const override;

    std::unique_ptr<IInputStream> openInput(const DeviceDescriptor& device,
                                            int framesPerRead) override;

    std::string backendName() const override { return "PortAudio"; }

    bool initialized() const { return paInitialized_; }

    // Name heuristic shared with tests
    static bool looksLikeLoopback(const std::string& deviceName);

private:
    std::vector<DeviceDescriptor> listDevices(bool loopback) const;

    bool paInitialized_ = false;
};
