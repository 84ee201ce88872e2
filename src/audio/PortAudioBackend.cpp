#include "audio/PortAudioBackend.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

#ifdef HAS_PORTAUDIO
#include <portaudio.h>
#endif

namespace {

#ifdef HAS_PORTAUDIO

DeviceDescriptor describe(PaDeviceIndex index, const PaDeviceInfo* info,
                          bool loopback) {
    DeviceDescriptor d;
    d.id               = index;
    d.displayName      = info->name ? info->name : "";
    d.channelCount     = info->maxInputChannels > 0 ? info->maxInputChannels
                                                    : info->maxOutputChannels;
    d.nativeSampleRate = info->defaultSampleRate;
    d.isLoopback       = loopback;
    if (const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi))
        d.hostApi = api->name;
    return d;
}

// Owns one blocking PaStream. Only the capture thread touches it.
class PortAudioInputStream : public IInputStream {
public:
    PortAudioInputStream(PaStream* stream, int channels)
        : stream_(stream), channels_(channels) {}

    ~PortAudioInputStream() override { close(); }

    void read(int16_t* out, int frameCount) override {
        if (!stream_)
            throw std::runtime_error("stream is closed");

        PaError err = Pa_ReadStream(stream_, out, frameCount);
        if (err == paInputOverflowed) {
            // Samples were lost upstream; the buffer we got is still valid
            spdlog::debug("Audio: input overflow ({} ch)", channels_);
            return;
        }
        if (err != paNoError)
            throw std::runtime_error(Pa_GetErrorText(err));
    }

    void close() override {
        if (!stream_) return;
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }

private:
    PaStream* stream_ = nullptr;
    int       channels_;
};

#endif

} // namespace

PortAudioBackend::PortAudioBackend() {
#ifdef HAS_PORTAUDIO
    PaError err = Pa_Initialize();
    if (err == paNoError) {
        paInitialized_ = true;
    } else {
        spdlog::error("PortAudio init failed: {}", Pa_GetErrorText(err));
    }
#endif
}

PortAudioBackend::~PortAudioBackend() {
#ifdef HAS_PORTAUDIO
    if (paInitialized_)
        Pa_Terminate();
#endif
}

bool PortAudioBackend::looksLikeLoopback(const std::string& deviceName) {
    std::string lower = deviceName;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower.find("loopback") != std::string::npos ||
           lower.rfind("monitor of", 0) == 0;
}

std::vector<DeviceDescriptor> PortAudioBackend::listDevices(bool loopback) const {
    std::vector<DeviceDescriptor> result;
#ifdef HAS_PORTAUDIO
    if (!paInitialized_) return result;

    int count = Pa_GetDeviceCount();
    if (count < 0)
        throw std::runtime_error(Pa_GetErrorText(count));

    for (int i = 0; i < count; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;
        bool isLoop = looksLikeLoopback(info->name ? info->name : "");
        if (isLoop == loopback)
            result.push_back(describe(i, info, isLoop));
    }
#else
    (void)loopback;
#endif
    return result;
}

std::vector<DeviceDescriptor> PortAudioBackend::listInputDevices() const {
    return listDevices(false);
}

std::vector<DeviceDescriptor> PortAudioBackend::listLoopbackDevices() const {
#ifdef HAS_PORTAUDIO
    return listDevices(true);
#else
    throw std::runtime_error("loopback capture unavailable: built without HAS_PORTAUDIO");
#endif
}

std::optional<DeviceDescriptor> PortAudioBackend::defaultInputDevice() const {
#ifdef HAS_PORTAUDIO
    if (!paInitialized_) return std::nullopt;
    PaDeviceIndex idx = Pa_GetDefaultInputDevice();
    if (idx == paNoDevice) return std::nullopt;
    if (const PaDeviceInfo* info = Pa_GetDeviceInfo(idx))
        return describe(idx, info, false);
#endif
    return std::nullopt;
}

std::optional<DeviceDescriptor> PortAudioBackend::defaultOutputDevice() const {
#ifdef HAS_PORTAUDIO
    if (!paInitialized_) return std::nullopt;
    PaDeviceIndex idx = Pa_GetDefaultOutputDevice();
    if (idx == paNoDevice) return std::nullopt;
    if (const PaDeviceInfo* info = Pa_GetDeviceInfo(idx))
        return describe(idx, info, false);
#endif
    return std::nullopt;
}

std::optional<DeviceDescriptor> PortAudioBackend::deviceById(int id) const {
#ifdef HAS_PORTAUDIO
    if (!paInitialized_ || id < 0 || id >= Pa_GetDeviceCount())
        return std::nullopt;
    const PaDeviceInfo* info = Pa_GetDeviceInfo(id);
    if (!info || info->maxInputChannels <= 0) return std::nullopt;
    return describe(id, info, looksLikeLoopback(info->name ? info->name : ""));
#else
    (void)id;
    return std::nullopt;
#endif
}

std::unique_ptr<IInputStream> PortAudioBackend::openInput(
    const DeviceDescriptor& device, int framesPerRead)
{
#ifdef HAS_PORTAUDIO
    if (!paInitialized_)
        throw DeviceOpenError("PortAudio is not initialised");

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device.id);
    if (!info)
        throw DeviceOpenError("Invalid audio device ID " + std::to_string(device.id));

    PaStreamParameters inputParams;
    inputParams.device                    = device.id;
    inputParams.channelCount              = std::max(1, device.channelCount);
    inputParams.sampleFormat              = paInt16;
    inputParams.suggestedLatency          = info->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    spdlog::info("Opening audio: device='{}', {} ch, {}Hz, {} frames/read",
                 device.displayName, inputParams.channelCount,
                 device.nativeSampleRate, framesPerRead);

    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(
        &stream,
        &inputParams,
        nullptr,  // no output
        device.nativeSampleRate,
        static_cast<unsigned long>(framesPerRead),
        paClipOff,
        nullptr,  // blocking API
        nullptr
    );
    if (err != paNoError)
        throw DeviceOpenError("Pa_OpenStream failed for '" + device.displayName +
                              "': " + Pa_GetErrorText(err));

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        Pa_CloseStream(stream);
        throw DeviceOpenError("Pa_StartStream failed for '" + device.displayName +
                              "': " + Pa_GetErrorText(err));
    }

    return std::make_unique<PortAudioInputStream>(stream, inputParams.channelCount);
#else
    (void)framesPerRead;
    throw DeviceOpenError("Cannot open '" + device.displayName +
                          "': built without HAS_PORTAUDIO");
#endif
}
