#pragma once
#include "ChannelCoordinator.hpp"
#include "core/Config.hpp"
#include "core/TranslationResult.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Owns all channels, fans start/stop out to them and routes every result to
// one sink tagged with the channel name. Results from different channels may
// arrive concurrently on their network threads.
class SessionSupervisor {
public:
    struct ChannelStatus {
        std::string name;
        std::string targetLang;
        SourceType  sourceType = SourceType::Microphone;
        std::string deviceName;                  // empty when not capturing
        StreamingSession::State state = StreamingSession::State::Idle;
        bool         running = false;
        std::string  lastError;
        SessionStats stats;
    };

    SessionSupervisor(AppConfig config, std::shared_ptr<IAudioBackend> backend,
                      TransportFactory transportFactory);
    ~SessionSupervisor();

    SessionSupervisor(const SessionSupervisor&) = delete;
    SessionSupervisor& operator=(const SessionSupervisor&) = delete;

    void setResultSink(ChannelResultCallback sink);

    // Throws DuplicateChannelName, MissingCredential. A channel added while
    // running is started right away.
    void addChannel(const ChannelConfig& config);

    // No-op when already running. If a channel fails, the channels started
    // so far are stopped and the error is rethrown. Returns quietly when a
    // concurrent stop() cancels it.
    void start();

    // Stops every channel even if some fail, then throws ShutdownError
    // listing the failures. Does not wait for a start() in progress.
    void stop();

    // Throws UnknownChannel
    void switchLanguage(const std::string& channel, const std::string& targetLang);

    std::vector<DeviceDescriptor> enumerateDevices() const;

    bool isRunning() const;
    std::vector<std::string> channelNames() const;
    std::vector<ChannelStatus> status() const;
    const AppConfig& config() const { return config_; }

private:
    ChannelCoordinator* find(const std::string& name) const;
    ResultCallback sinkFor(const std::string& channel);
    void rollback(const std::vector<ChannelCoordinator*>& started);
    void deliver(const std::string& channel, const TranslationResult& result);

    AppConfig                      config_;
    std::shared_ptr<IAudioBackend> backend_;
    TransportFactory               transportFactory_;

    std::mutex startMtx_;               // serialises start()

    mutable std::mutex lifecycleMtx_;   // guards channels_, running_, stopGeneration_
    std::vector<std::unique_ptr<ChannelCoordinator>> channels_;
    bool     running_ = false;
    uint64_t stopGeneration_ = 0;

    std::mutex            sinkMtx_;
    ChannelResultCallback sink_;
};
