#include "session/StreamingSession.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <condition_variable>
#include <future>
#include <thread>

// Grace on top of the transport's own connect timeout for session.update
// and the optional acknowledgement.
static constexpr int kConfigureGraceMs = 5000;

// ── Run ──────────────────────────────────────────────────────────────────
// Shared between the session and its network thread, so a thread abandoned
// by a bounded join still has valid state to finish with.

struct StreamingSession::Run {
    ChannelContext ctx;
    SessionParams  params;
    bool           requireAck = false;
    ResultCallback onResult;
    std::shared_ptr<Counters> counters;
    ClientMessageBuilder messages;
    std::unique_ptr<IRealtimeTransport> transport;

    mutable std::mutex      mtx;   // guards state and error
    std::condition_variable cv;
    State                   state = State::Idle;
    std::string             error;

    std::mutex deliveryMtx;        // held while the sink runs
    bool       accepting = true;

    std::thread        thread;
    std::promise<void> exitedPromise;
    std::future<void>  exited = exitedPromise.get_future();
    std::atomic<bool>  retired{false};

    static bool isActive(State s) {
        return s == State::Connecting || s == State::Configuring ||
               s == State::Streaming;
    }

    State getState() const {
        std::lock_guard lock(mtx);
        return state;
    }

    bool active() const { return isActive(getState()); }

    std::string errorText() const {
        std::lock_guard lock(mtx);
        return error;
    }

    // ── Transitions ──

    void handleOpen() {
        {
            std::lock_guard lock(mtx);
            if (state != State::Connecting) return;
            state = State::Configuring;
        }
        cv.notify_all();
        spdlog::info("Session[{}]: connected, configuring (target={})",
                     ctx.channelName, ctx.targetLang);

        if (!transport->send(messages.sessionUpdate(params))) {
            handleError("could not send session configuration");
            transport->close();
            return;
        }
        if (!requireAck) promote();
    }

    void promote() {
        {
            std::lock_guard lock(mtx);
            if (state != State::Configuring) return;
            state = State::Streaming;
        }
        cv.notify_all();
        spdlog::info("Session[{}]: streaming", ctx.channelName);
    }

    void handleMessage(const std::string& raw) {
        std::optional<ServerEvent> event;
        try {
            event = parseServerEventOrThrow(raw);
        } catch (const ProtocolParseError& e) {
            counters->parseFailures++;
            spdlog::warn("Session[{}]: skipping malformed message: {}",
                         ctx.channelName, e.what());
            return;
        }

        if (std::holds_alternative<SessionUpdatedEvent>(*event))
            promote();

        auto result = classifyEvent(*event, ctx);
        if (!result) return;

        std::lock_guard lock(deliveryMtx);
        if (!accepting || !onResult) return;
        try {
            onResult(*result);
            counters->resultsDelivered++;
        } catch (const std::exception& e) {
            spdlog::error("Session[{}]: result sink failed: {}", ctx.channelName, e.what());
        }
    }

    void handleError(const std::string& reason) {
        {
            std::lock_guard lock(mtx);
            if (!isActive(state)) {
                spdlog::debug("Session[{}]: {} (while {})", ctx.channelName, reason,
                              stateName(state));
                return;
            }
            state = State::Error;
            error = reason;
        }
        cv.notify_all();
        spdlog::error("Session[{}]: connection error: {}", ctx.channelName, reason);
    }

    // transport->run() returned
    void handleExit() {
        bool unexpected = false;
        {
            std::lock_guard lock(mtx);
            if (isActive(state)) {
                state = State::Error;
                error = "connection closed unexpectedly";
                unexpected = true;
            }
        }
        cv.notify_all();
        if (unexpected)
            spdlog::error("Session[{}]: connection closed unexpectedly", ctx.channelName);
    }

    // Stops result delivery and audio acceptance, then asks the transport to close
    void beginClose() {
        {
            std::lock_guard lock(mtx);
            if (isActive(state)) state = State::Closing;
        }
        cv.notify_all();
        {
            std::lock_guard lock(deliveryMtx);
            accepting = false;
        }
        transport->close();
    }

    void markClosed() {
        std::lock_guard lock(mtx);
        if (state != State::Error) state = State::Closed;
    }

    // True once the state left Connecting/Configuring
    bool waitSettled(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mtx);
        return cv.wait_for(lock, timeout, [this] {
            return state != State::Connecting && state != State::Configuring;
        });
    }

    bool trySend(const std::vector<uint8_t>& pcm) {
        std::lock_guard lock(mtx);
        if (state != State::Streaming) return false;
        return transport->send(messages.appendAudio(pcm));
    }
};

// ── StreamingSession ─────────────────────────────────────────────────────

StreamingSession::StreamingSession(std::string channelName, const AppConfig& config,
                                   TransportFactory transportFactory)
    : channelName_(std::move(channelName))
    , service_(config.service)
    , audio_(config.audio)
    , vad_(config.vad)
    , transportFactory_(std::move(transportFactory))
    , targetLang_(config.ui.defaultTargetLang)
{
    service_.apiKey = resolveApiKey(service_);
    if (service_.apiKey.empty())
        throw MissingCredential();
}

StreamingSession::~StreamingSession() {
    try {
        stop();
    } catch (const ConnectionError& e) {
        spdlog::error("{}", e.what());
    }
}

const char* StreamingSession::stateName(State s) {
    switch (s) {
        case State::Idle:        return "idle";
        case State::Connecting:  return "connecting";
        case State::Configuring: return "configuring";
        case State::Streaming:   return "streaming";
        case State::Closing:     return "closing";
        case State::Closed:      return "closed";
        case State::Error:       return "error";
    }
    return "unknown";
}

Endpoint StreamingSession::endpoint() const {
    Endpoint ep;
    ep.url = service_.websocketUrl;
    ep.url += ep.url.find('?') == std::string::npos ? '?' : '&';
    ep.url += "model=" + service_.model;
    ep.headers.emplace_back("Authorization", "Bearer " + service_.apiKey);
    ep.connectTimeout = std::chrono::milliseconds(service_.connectTimeoutMs);
    return ep;
}

std::shared_ptr<StreamingSession::Run> StreamingSession::makeRun(
    const std::string& targetLang, ResultCallback onResult)
{
    auto run = std::make_shared<Run>();
    run->ctx        = ChannelContext{channelName_, targetLang, "auto"};
    run->params     = SessionParams{targetLang, audio_.format, audio_.sampleRate, vad_};
    run->requireAck = service_.requireConfigAck;
    run->onResult   = std::move(onResult);
    run->counters   = counters_;

    run->transport = transportFactory_ ? transportFactory_() : nullptr;
    if (!run->transport)
        throw ConnectionError("Session[" + channelName_ + "]: no transport available");

    Run* r = run.get();
    run->transport->onOpen    = [r] { r->handleOpen(); };
    run->transport->onMessage = [r](const std::string& raw) { r->handleMessage(raw); };
    run->transport->onError   = [r](const std::string& reason) { r->handleError(reason); };
    return run;
}

void StreamingSession::networkLoop(std::shared_ptr<Run> run, Endpoint endpoint) {
    try {
        run->transport->run(endpoint);
    } catch (const std::exception& e) {
        run->handleError(std::string("transport failure: ") + e.what());
    }
    run->handleExit();
    run->exitedPromise.set_value();
}

void StreamingSession::start(const std::string& targetLang, ResultCallback onResult) {
    std::lock_guard lifecycle(lifecycleMtx_);
    uint64_t generation = 0;
    {
        std::lock_guard lock(currentMtx_);
        generation = stopGeneration_;
    }
    startLocked(targetLang, std::move(onResult), generation);
}

// Gives up as soon as stopGeneration_ moves past `generation`, whether the
// stop landed before or after the new run was published.
void StreamingSession::startLocked(const std::string& targetLang, ResultCallback onResult,
                                   uint64_t generation) {
    std::shared_ptr<Run> stale;
    {
        std::lock_guard lock(currentMtx_);
        if (stopGeneration_ != generation) {
            spdlog::info("Session[{}]: start cancelled by stop()", channelName_);
            return;
        }
        if (current_ && current_->active()) {
            spdlog::debug("Session[{}]: already running", channelName_);
            return;
        }
        stale = std::move(current_);
    }
    if (stale) {
        // left over from a dropped connection
        auto err = retire(stale);
        if (!err.empty())
            spdlog::warn("Session[{}]: closing stale connection failed: {}", channelName_, err);
    }

    auto run = makeRun(targetLang, onResult);
    bool cancelled = false;
    {
        std::lock_guard lock(currentMtx_);
        if (stopGeneration_ != generation) {
            cancelled = true;
        } else {
            sink_       = std::move(onResult);
            targetLang_ = targetLang;
            lastError_.clear();
            run->state  = State::Connecting;
            run->thread = std::thread(&StreamingSession::networkLoop, run, endpoint());
            current_    = run;
        }
    }
    if (cancelled) {
        auto err = retire(run);
        if (!err.empty())
            spdlog::warn("Session[{}]: closing unused transport failed: {}", channelName_, err);
        spdlog::info("Session[{}]: start cancelled by stop()", channelName_);
        return;
    }
    spdlog::info("Session[{}]: connecting to {} (model={}, target={})",
                 channelName_, service_.websocketUrl, service_.model, targetLang);

    bool settled = run->waitSettled(
        std::chrono::milliseconds(service_.connectTimeoutMs + kConfigureGraceMs));
    State s = run->getState();

    if (s == State::Streaming) return;
    if (s == State::Closing || s == State::Closed) {
        spdlog::info("Session[{}]: start cancelled by stop()", channelName_);
        return;
    }

    std::string reason = settled ? run->errorText() : "timed out waiting for the service";
    bool owned = false;
    {
        std::lock_guard lock(currentMtx_);
        if (current_ == run) {
            current_.reset();
            owned = true;
        }
    }
    auto closeErr = retire(run);
    if (!closeErr.empty())
        spdlog::warn("Session[{}]: closing failed connection: {}", channelName_, closeErr);
    if (!owned) return;   // a concurrent stop() took it over

    {
        std::lock_guard lock(currentMtx_);
        lastState_ = State::Error;
        lastError_ = reason;
    }
    throw ConnectionError("Session[" + channelName_ + "]: " + reason);
}

// Returns the transport's close failure, empty when it closed cleanly. The
// network thread is joined (or abandoned) either way.
std::string StreamingSession::retire(const std::shared_ptr<Run>& run) {
    if (run->retired.exchange(true)) return {};

    std::string closeError;
    try {
        run->beginClose();
    } catch (const std::exception& e) {
        closeError = e.what();
    }

    if (run->thread.joinable()) {
        auto timeout = std::chrono::milliseconds(service_.closeTimeoutMs);
        if (run->exited.wait_for(timeout) == std::future_status::ready) {
            run->thread.join();
        } else {
            spdlog::warn("Session[{}]: network thread did not exit within {}ms, "
                         "abandoning it", channelName_, timeout.count());
            run->thread.detach();
        }
    }
    run->markClosed();
    return closeError;
}

void StreamingSession::stop() {
    std::shared_ptr<Run> run;
    {
        std::lock_guard lock(currentMtx_);
        stopGeneration_++;
        sink_ = nullptr;
        run = std::move(current_);
        if (!run) return;
        lastState_ = State::Closed;
    }

    spdlog::info("Session[{}]: stopping", channelName_);
    std::string closeError = retire(run);

    std::string err = closeError.empty() ? run->errorText() : closeError;
    if (!err.empty()) {
        std::lock_guard lock(currentMtx_);
        lastError_ = err;
    }
    if (!closeError.empty())
        throw ConnectionError("Session[" + channelName_ + "]: close failed: " + closeError);
    spdlog::info("Session[{}]: stopped", channelName_);
}

void StreamingSession::switchLanguage(const std::string& targetLang) {
    std::lock_guard lifecycle(lifecycleMtx_);

    // sink_ and current_ leave together; a stop() after this cancels the
    // restart below through stopGeneration_.
    ResultCallback sink;
    std::shared_ptr<Run> old;
    uint64_t generation = 0;
    {
        std::lock_guard lock(currentMtx_);
        targetLang_ = targetLang;
        if (!sink_) {
            spdlog::info("Session[{}]: target language set to {} (not started)",
                         channelName_, targetLang);
            return;
        }
        sink       = std::move(sink_);
        sink_      = nullptr;
        old        = std::move(current_);
        generation = stopGeneration_;
        lastState_ = State::Closed;
    }

    spdlog::info("Session[{}]: switching target language to {}", channelName_, targetLang);
    if (old) {
        auto err = retire(old);
        if (!err.empty())
            spdlog::warn("Session[{}]: closing previous connection failed: {}",
                         channelName_, err);
    }
    startLocked(targetLang, std::move(sink), generation);
}

void StreamingSession::sendAudio(const std::vector<uint8_t>& pcm) {
    if (pcm.empty()) return;

    std::shared_ptr<Run> run;
    {
        std::lock_guard lock(currentMtx_);
        run = current_;
    }

    if (run && run->trySend(pcm)) {
        counters_->framesSent++;
        counters_->bytesSent += pcm.size();
    } else {
        counters_->framesDropped++;
    }
}

bool StreamingSession::isRunning() const {
    std::lock_guard lock(currentMtx_);
    return current_ && current_->active();
}

StreamingSession::State StreamingSession::state() const {
    std::lock_guard lock(currentMtx_);
    return current_ ? current_->getState() : lastState_;
}

std::string StreamingSession::targetLang() const {
    std::lock_guard lock(currentMtx_);
    return targetLang_;
}

std::string StreamingSession::lastError() const {
    std::lock_guard lock(currentMtx_);
    if (current_) {
        auto err = current_->errorText();
        if (!err.empty()) return err;
    }
    return lastError_;
}

SessionStats StreamingSession::stats() const {
    SessionStats s;
    s.framesSent       = counters_->framesSent;
    s.framesDropped    = counters_->framesDropped;
    s.bytesSent        = counters_->bytesSent;
    s.resultsDelivered = counters_->resultsDelivered;
    s.parseFailures    = counters_->parseFailures;
    return s;
}
