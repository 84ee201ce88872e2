#include "audio/AudioSource.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

// ── CaptureHandle ────────────────────────────────────────────────────────

CaptureHandle::CaptureHandle(Token, DeviceDescriptor device, std::shared_ptr<Loop> loop,
                             std::chrono::milliseconds stopTimeout)
    : device_(std::move(device))
    , loop_(std::move(loop))
    , stopTimeout_(stopTimeout)
{
    exited_ = loop_->exited.get_future();
    thread_ = std::thread(&CaptureHandle::run, loop_);
}

CaptureHandle::~CaptureHandle() {
    stop();
}

void CaptureHandle::stop() {
    {
        std::lock_guard lock(mtx_);
        if (state_ != State::Running) return;
        state_ = State::Stopping;
    }

    loop_->stopRequested = true;

    if (thread_.joinable()) {
        if (exited_.wait_for(stopTimeout_) == std::future_status::ready) {
            thread_.join();
        } else {
            spdlog::warn("Audio: capture thread for '{}' did not exit within {}ms, "
                         "abandoning it", device_.displayName, stopTimeout_.count());
            thread_.detach();
        }
    }

    std::lock_guard lock(mtx_);
    state_ = State::Stopped;
    spdlog::info("Audio: capture stopped ({})", device_.displayName);
}

bool CaptureHandle::isRunning() const {
    std::lock_guard lock(mtx_);
    return state_ == State::Running && loop_->alive;
}

CaptureHandle::State CaptureHandle::state() const {
    std::lock_guard lock(mtx_);
    return state_;
}

uint64_t CaptureHandle::framesDelivered() const {
    return loop_->delivered;
}

void CaptureHandle::run(std::shared_ptr<Loop> loop) {
    const int channels = loop->converter.deviceChannels();
    std::vector<int16_t> buffer(static_cast<size_t>(loop->framesPerRead) * channels);

    spdlog::debug("Audio: capture thread started ({})", loop->deviceName);

    while (!loop->stopRequested) {
        try {
            loop->stream->read(buffer.data(), loop->framesPerRead);
        } catch (const std::exception& e) {
            if (!loop->stopRequested)
                spdlog::error("Audio: read error on '{}': {}", loop->deviceName, e.what());
            break;
        }

        if (loop->stopRequested) break;

        auto pcm = loop->converter.convert(buffer.data(), loop->framesPerRead);
        if (pcm.empty() || !loop->onFrame) continue;

        try {
            loop->onFrame(pcm);
            loop->delivered++;
        } catch (const std::exception& e) {
            spdlog::error("Audio: frame consumer failed: {}", e.what());
        }
    }

    try {
        loop->stream->close();
    } catch (const std::exception& e) {
        spdlog::warn("Audio: closing '{}' failed: {}", loop->deviceName, e.what());
    }

    loop->alive = false;
    spdlog::debug("Audio: capture thread exited ({})", loop->deviceName);
    loop->exited.set_value();
}

// ── AudioSource ──────────────────────────────────────────────────────────

AudioSource::AudioSource(std::shared_ptr<IAudioBackend> backend,
                         const AudioConfig& config)
    : backend_(std::move(backend))
    , config_(config) {}

std::vector<DeviceDescriptor> AudioSource::enumerate() const {
    std::vector<DeviceDescriptor> result;

    try {
        result = backend_->listInputDevices();
    } catch (const std::exception& e) {
        spdlog::warn("Audio: cannot enumerate input devices: {}", e.what());
    }

    try {
        auto loopbacks = backend_->listLoopbackDevices();
        result.insert(result.end(), loopbacks.begin(), loopbacks.end());
    } catch (const std::exception& e) {
        spdlog::warn("Audio: cannot enumerate loopback devices: {}", e.what());
    }

    return result;
}

DeviceDescriptor AudioSource::resolve(SourceType type,
                                      std::optional<int> selector) const {
    if (selector) {
        if (auto dev = backend_->deviceById(*selector)) {
            spdlog::info("Audio: using specified device [{}] {}", dev->id, dev->displayName);
            return *dev;
        }
        spdlog::warn("Audio: specified device {} unavailable, auto-selecting", *selector);
    }

    switch (type) {
        case SourceType::Microphone: {
            auto dev = backend_->defaultInputDevice();
            if (!dev)
                throw DeviceNotFound("No default microphone");
            spdlog::info("Audio: default microphone: {}", dev->displayName);
            return *dev;
        }
        case SourceType::SystemLoopback:
            return resolveLoopback();
        case SourceType::Both:
            break;
    }
    throw DeviceNotFound("Source type '" + sourceTypeToString(type) +
                         "' needs one channel per device");
}

DeviceDescriptor AudioSource::resolveLoopback() const {
    auto output = backend_->defaultOutputDevice();
    if (!output)
        throw DeviceNotFound("No default output device to capture from");
    spdlog::info("Audio: default output device: {}", output->displayName);

    std::vector<DeviceDescriptor> candidates;
    try {
        candidates = backend_->listLoopbackDevices();
    } catch (const std::exception& e) {
        throw DeviceNotFound(std::string("Loopback search failed: ") + e.what());
    }

    auto match = matchLoopback(output->displayName, candidates);
    if (!match)
        throw DeviceNotFound("No loopback device for '" + output->displayName + "'");

    spdlog::info("Audio: found loopback: {}", match->displayName);
    return *match;
}

std::optional<DeviceDescriptor> AudioSource::matchLoopback(
    const std::string& outputName,
    const std::vector<DeviceDescriptor>& candidates)
{
    if (outputName.empty()) return std::nullopt;

    for (auto& c : candidates) {
        if (c.displayName.find(outputName) != std::string::npos)
            return c;
    }

    std::string shortName = outputName.substr(0, kFuzzyPrefixLength);
    for (auto& c : candidates) {
        if (c.displayName.find(shortName) != std::string::npos) {
            spdlog::debug("Audio: loopback '{}' matched by prefix '{}'",
                          c.displayName, shortName);
            return c;
        }
    }
    return std::nullopt;
}

std::shared_ptr<CaptureHandle> AudioSource::start(const DeviceDescriptor& device,
                                                  int targetSampleRate,
                                                  FrameCallback onFrame) {
    PcmConverter converter(static_cast<int>(std::lround(device.nativeSampleRate)),
                           device.channelCount, targetSampleRate);
    int framesPerRead = converter.deviceFramesPerChunk(config_.chunkMs);
    if (framesPerRead <= 0)
        throw DeviceOpenError("Device '" + device.displayName +
                              "' reports an unusable sample rate");

    if (!converter.passthrough()) {
        spdlog::info("Audio: resampling {}Hz/{}ch -> {}Hz/1ch",
                     converter.deviceRate(), converter.deviceChannels(),
                     targetSampleRate);
    }

    auto stream = backend_->openInput(device, framesPerRead);

    auto loop = std::make_shared<CaptureHandle::Loop>(
        backend_, std::move(stream), converter, framesPerRead, std::move(onFrame),
        device.displayName);

    spdlog::info("Audio: capture started on '{}' via {}",
                 device.displayName, backend_->backendName());

    return std::make_shared<CaptureHandle>(
        CaptureHandle::Token{}, device, std::move(loop),
        std::chrono::milliseconds(config_.stopTimeoutMs));
}

void AudioSource::stop(const std::shared_ptr<CaptureHandle>& handle) {
    if (handle) handle->stop();
}
