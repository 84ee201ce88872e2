#pragma once
#include "audio/AudioSource.hpp"
#include "session/StreamingSession.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct ChannelConfig {
    std::string        name;                 // unique within a supervisor
    std::string        targetLang = "en";
    SourceType         sourceType = SourceType::Microphone;
    std::optional<int> deviceSelector;       // empty = auto-select
};

// One channel: an AudioSource whose frames feed one StreamingSession.
// Source type and device are fixed for the channel's lifetime; the target
// language can change at any time.
class ChannelCoordinator {
public:
    // Throws MissingCredential
    ChannelCoordinator(ChannelConfig config, const AppConfig& app,
                       std::shared_ptr<IAudioBackend> backend,
                       TransportFactory transportFactory);
    ~ChannelCoordinator();

    ChannelCoordinator(const ChannelCoordinator&) = delete;
    ChannelCoordinator& operator=(const ChannelCoordinator&) = delete;

    // Session first, then capture. If capture cannot start the session is
    // stopped again. Throws ConnectionError, DeviceNotFound, DeviceOpenError.
    void start(ResultCallback onResult);

    // Capture first, then the session. Idempotent. Throws ConnectionError
    // when the session's transport fails to close.
    void stop();

    // Restarts the session only; capture keeps running. When the channel is
    // stopped the language is stored for the next start().
    void switchLanguage(const std::string& targetLang);

    // Both capture and session alive
    bool isRunning() const;

    const std::string& name() const { return config_.name; }
    SourceType sourceType() const { return config_.sourceType; }
    std::string targetLang() const;
    std::optional<DeviceDescriptor> device() const;

    StreamingSession::State sessionState() const { return session_.state(); }
    std::string  lastError() const { return session_.lastError(); }
    SessionStats stats() const { return session_.stats(); }

private:
    void stopSessionQuietly();

    ChannelConfig    config_;
    int              sampleRate_;
    AudioSource      audio_;
    StreamingSession session_;

    std::mutex startMtx_;                   // serialises start()
    mutable std::mutex mtx_;                // guards capture_, config_.targetLang
    std::shared_ptr<CaptureHandle> capture_;
    std::atomic<uint64_t> stopGeneration_{0};
};
