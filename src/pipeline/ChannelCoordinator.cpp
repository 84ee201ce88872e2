#include "pipeline/ChannelCoordinator.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>

ChannelCoordinator::ChannelCoordinator(ChannelConfig config, const AppConfig& app,
                                       std::shared_ptr<IAudioBackend> backend,
                                       TransportFactory transportFactory)
    : config_(std::move(config))
    , sampleRate_(app.audio.sampleRate)
    , audio_(std::move(backend), app.audio)
    , session_(config_.name, app, std::move(transportFactory)) {}

ChannelCoordinator::~ChannelCoordinator() {
    try {
        stop();
    } catch (const InterpreterError& e) {
        spdlog::error("Channel[{}]: {}", config_.name, e.what());
    }
}

// Logs a close failure instead of rethrowing it
void ChannelCoordinator::stopSessionQuietly() {
    try {
        session_.stop();
    } catch (const ConnectionError& e) {
        spdlog::error("Channel[{}]: {}", config_.name, e.what());
    }
}

void ChannelCoordinator::start(ResultCallback onResult) {
    std::lock_guard startLock(startMtx_);

    std::shared_ptr<CaptureHandle> stale;
    std::string target;
    {
        std::lock_guard lock(mtx_);
        if (capture_ && capture_->isRunning() && session_.isRunning()) return;
        stale = std::move(capture_);
        target = config_.targetLang;
    }
    audio_.stop(stale);

    const uint64_t generation = stopGeneration_;

    session_.start(target, std::move(onResult));
    if (!session_.isRunning()) {
        spdlog::info("Channel[{}]: start cancelled", config_.name);
        return;
    }

    std::shared_ptr<CaptureHandle> capture;
    try {
        auto device = audio_.resolve(config_.sourceType, config_.deviceSelector);
        capture = audio_.start(device, sampleRate_,
            [this](const std::vector<uint8_t>& pcm) { session_.sendAudio(pcm); });
    } catch (const InterpreterError& e) {
        spdlog::error("Channel[{}]: audio start failed: {}", config_.name, e.what());
        stopSessionQuietly();
        throw;
    }

    bool cancelled = false;
    {
        std::lock_guard lock(mtx_);
        if (stopGeneration_ != generation)
            cancelled = true;
        else
            capture_ = capture;
    }
    if (cancelled) {
        // stop() ran while the capture was opening
        audio_.stop(capture);
        stopSessionQuietly();
        return;
    }

    spdlog::info("Channel[{}]: running ({} -> {})", config_.name,
                 capture->device().displayName, target);
}

void ChannelCoordinator::stop() {
    std::shared_ptr<CaptureHandle> capture;
    {
        std::lock_guard lock(mtx_);
        stopGeneration_++;
        capture = std::move(capture_);
    }
    // Capture must end before the session so no frame is sent into a
    // closing transport
    audio_.stop(capture);
    session_.stop();
}

void ChannelCoordinator::switchLanguage(const std::string& targetLang) {
    bool running = false;
    uint64_t generation = 0;
    {
        std::lock_guard lock(mtx_);
        config_.targetLang = targetLang;
        running = capture_ != nullptr;
        generation = stopGeneration_;
    }
    if (!running) {
        spdlog::info("Channel[{}]: target language set to {}", config_.name, targetLang);
        return;
    }
    session_.switchLanguage(targetLang);

    // A stop() that finished before the session saw the switch would
    // otherwise leave the new connection running without capture
    if (stopGeneration_ != generation) {
        spdlog::info("Channel[{}]: stopped during language switch", config_.name);
        stopSessionQuietly();
    }
}

bool ChannelCoordinator::isRunning() const {
    std::lock_guard lock(mtx_);
    return capture_ && capture_->isRunning() && session_.isRunning();
}

std::string ChannelCoordinator::targetLang() const {
    std::lock_guard lock(mtx_);
    return config_.targetLang;
}

std::optional<DeviceDescriptor> ChannelCoordinator::device() const {
    std::lock_guard lock(mtx_);
    if (!capture_) return std::nullopt;
    return capture_->device();
}
