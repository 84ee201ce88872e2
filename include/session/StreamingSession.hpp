#pragma once
#include "ClientMessages.hpp"
#include "ServerEvents.hpp"
#include "core/Config.hpp"
#include "core/TranslationResult.hpp"
#include "transport/IRealtimeTransport.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct SessionStats {
    uint64_t framesSent       = 0;
    uint64_t framesDropped    = 0;   // not streaming, or transport queue full
    uint64_t bytesSent        = 0;   // raw PCM, before base64
    uint64_t resultsDelivered = 0;
    uint64_t parseFailures    = 0;
};

// One live connection to the recognize+translate service for one channel.
//
// Each start() creates a fresh transport driven by its own network thread;
// results are delivered to the sink from that thread, one at a time.
// stop() is safe from any thread and in any state, including while start()
// is still waiting for the connection. It joins the network thread with a
// bounded wait and abandons it beyond that.
//
// The result sink must not call stop() or switchLanguage() on the same
// session: teardown waits for an in-progress delivery to return.
class StreamingSession {
public:
    enum class State { Idle, Connecting, Configuring, Streaming, Closing, Closed, Error };

    // Throws MissingCredential when no API key is configured or in the env
    StreamingSession(std::string channelName, const AppConfig& config,
                     TransportFactory transportFactory);
    ~StreamingSession();

    StreamingSession(const StreamingSession&) = delete;
    StreamingSession& operator=(const StreamingSession&) = delete;

    // Blocks until Streaming. Throws ConnectionError when the connection
    // fails or times out. Returns quietly if stop() cancelled it. No-op when
    // already running.
    void start(const std::string& targetLang, ResultCallback onResult);

    // Idempotent. Cancels a start() or switchLanguage() in progress on
    // another thread. Throws ConnectionError when the transport fails to
    // close; the network thread is still joined and the session is left
    // stopped.
    void stop();

    // Closes the current connection and starts one with the new target and
    // the same sink. If the session is not started (or was stopped) only
    // the target is remembered.
    void switchLanguage(const std::string& targetLang);

    // Silently dropped unless Streaming. Called from the capture thread.
    void sendAudio(const std::vector<uint8_t>& pcm);

    bool         isRunning() const;
    State        state() const;
    std::string  targetLang() const;
    std::string  lastError() const;
    SessionStats stats() const;
    const std::string& channelName() const { return channelName_; }

    static const char* stateName(State s);

private:
    struct Counters {
        std::atomic<uint64_t> framesSent{0};
        std::atomic<uint64_t> framesDropped{0};
        std::atomic<uint64_t> bytesSent{0};
        std::atomic<uint64_t> resultsDelivered{0};
        std::atomic<uint64_t> parseFailures{0};
    };

    struct Run;   // one connection attempt and its network thread

    void startLocked(const std::string& targetLang, ResultCallback onResult,
                     uint64_t generation);
    std::shared_ptr<Run> makeRun(const std::string& targetLang, ResultCallback onResult);
    std::string retire(const std::shared_ptr<Run>& run);
    Endpoint endpoint() const;

    static void networkLoop(std::shared_ptr<Run> run, Endpoint endpoint);

    const std::string channelName_;
    ServiceConfig     service_;
    AudioConfig       audio_;
    VadConfig         vad_;
    TransportFactory  transportFactory_;

    std::shared_ptr<Counters> counters_ = std::make_shared<Counters>();

    std::mutex lifecycleMtx_;   // serialises start/switchLanguage

    mutable std::mutex   currentMtx_;   // guards the fields below
    std::shared_ptr<Run> current_;
    ResultCallback       sink_;
    std::string          targetLang_;
    State                lastState_ = State::Idle;
    std::string          lastError_;
    uint64_t             stopGeneration_ = 0;   // bumped by every stop()
};
