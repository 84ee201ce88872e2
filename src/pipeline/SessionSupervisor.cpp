#include "pipeline/SessionSupervisor.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>

SessionSupervisor::SessionSupervisor(AppConfig config,
                                     std::shared_ptr<IAudioBackend> backend,
                                     TransportFactory transportFactory)
    : config_(std::move(config))
    , backend_(std::move(backend))
    , transportFactory_(std::move(transportFactory)) {}

SessionSupervisor::~SessionSupervisor() {
    try {
        stop();
    } catch (const ShutdownError& e) {
        spdlog::error("Supervisor: {}", e.what());
    }
}

void SessionSupervisor::setResultSink(ChannelResultCallback sink) {
    std::lock_guard lock(sinkMtx_);
    sink_ = std::move(sink);
}

ResultCallback SessionSupervisor::sinkFor(const std::string& channel) {
    return [this, channel](const TranslationResult& result) {
        deliver(channel, result);
    };
}

void SessionSupervisor::deliver(const std::string& channel,
                                const TranslationResult& result) {
    ChannelResultCallback sink;
    {
        std::lock_guard lock(sinkMtx_);
        sink = sink_;
    }
    if (sink) sink(channel, result);
}

ChannelCoordinator* SessionSupervisor::find(const std::string& name) const {
    for (auto& ch : channels_)
        if (ch->name() == name) return ch.get();
    return nullptr;
}

void SessionSupervisor::addChannel(const ChannelConfig& config) {
    std::lock_guard lock(lifecycleMtx_);
    if (find(config.name))
        throw DuplicateChannelName(config.name);

    auto channel = std::make_unique<ChannelCoordinator>(
        config, config_, backend_, transportFactory_);
    spdlog::info("Supervisor: added channel '{}' ({}, target={})", config.name,
                 sourceTypeToString(config.sourceType), config.targetLang);

    if (running_)
        channel->start(sinkFor(config.name));
    channels_.push_back(std::move(channel));
}

void SessionSupervisor::rollback(const std::vector<ChannelCoordinator*>& started) {
    for (auto* ch : started) {
        try {
            ch->stop();
        } catch (const std::exception& e) {
            spdlog::error("Supervisor: rollback of '{}' failed: {}", ch->name(), e.what());
        }
    }
}

// lifecycleMtx_ is only held between channel starts, so stop() can cancel a
// start that is still waiting on a connection.
void SessionSupervisor::start() {
    std::lock_guard startLock(startMtx_);

    uint64_t generation = 0;
    {
        std::lock_guard lock(lifecycleMtx_);
        if (running_) {
            spdlog::debug("Supervisor: already running");
            return;
        }
        generation = stopGeneration_;
    }

    std::vector<ChannelCoordinator*> started;
    for (size_t i = 0;; i++) {
        ChannelCoordinator* ch = nullptr;
        bool cancelled = false;
        {
            std::lock_guard lock(lifecycleMtx_);
            cancelled = stopGeneration_ != generation;
            if (!cancelled && i >= channels_.size()) {
                running_ = true;
                spdlog::info("Supervisor: {} channel(s) running", channels_.size());
                return;
            }
            if (!cancelled) ch = channels_[i].get();
        }
        if (cancelled) {
            // stop() may have passed a channel before it finished starting
            spdlog::info("Supervisor: start cancelled by stop()");
            rollback(started);
            return;
        }

        try {
            ch->start(sinkFor(ch->name()));
            started.push_back(ch);
        } catch (const InterpreterError& e) {
            rollback(started);
            {
                std::lock_guard lock(lifecycleMtx_);
                cancelled = stopGeneration_ != generation;
            }
            if (cancelled) {
                spdlog::info("Supervisor: start cancelled by stop() ({})", e.what());
                return;
            }
            spdlog::error("Supervisor: channel '{}' failed to start: {}",
                          ch->name(), e.what());
            throw;
        }
    }
}

void SessionSupervisor::stop() {
    std::vector<ChannelCoordinator*> channels;
    bool wasRunning = false;
    {
        std::lock_guard lock(lifecycleMtx_);
        stopGeneration_++;
        for (auto& ch : channels_) channels.push_back(ch.get());
        wasRunning = running_;
        running_ = false;
    }

    std::vector<ShutdownError::Failure> failures;
    for (auto* ch : channels) {
        try {
            ch->stop();
        } catch (const std::exception& e) {
            spdlog::error("Supervisor: channel '{}' failed to stop: {}",
                          ch->name(), e.what());
            failures.emplace_back(ch->name(), e.what());
        }
    }

    if (wasRunning) spdlog::info("Supervisor: stopped");

    if (!failures.empty())
        throw ShutdownError(std::move(failures));
}

void SessionSupervisor::switchLanguage(const std::string& channel,
                                       const std::string& targetLang) {
    ChannelCoordinator* ch = nullptr;
    {
        std::lock_guard lock(lifecycleMtx_);
        ch = find(channel);
    }
    if (!ch) throw UnknownChannel(channel);

    spdlog::info("Supervisor: '{}' target language -> {}", channel, targetLang);
    ch->switchLanguage(targetLang);
}

std::vector<DeviceDescriptor> SessionSupervisor::enumerateDevices() const {
    AudioSource source(backend_, config_.audio);
    return source.enumerate();
}

bool SessionSupervisor::isRunning() const {
    std::lock_guard lock(lifecycleMtx_);
    return running_;
}

std::vector<std::string> SessionSupervisor::channelNames() const {
    std::lock_guard lock(lifecycleMtx_);
    std::vector<std::string> names;
    for (auto& ch : channels_) names.push_back(ch->name());
    return names;
}

std::vector<SessionSupervisor::ChannelStatus> SessionSupervisor::status() const {
    std::vector<ChannelCoordinator*> channels;
    {
        std::lock_guard lock(lifecycleMtx_);
        for (auto& ch : channels_) channels.push_back(ch.get());
    }

    std::vector<ChannelStatus> out;
    for (auto* ch : channels) {
        ChannelStatus s;
        s.name       = ch->name();
        s.targetLang = ch->targetLang();
        s.sourceType = ch->sourceType();
        if (auto dev = ch->device()) s.deviceName = dev->displayName;
        s.state      = ch->sessionState();
        s.running    = ch->isRunning();
        s.lastError  = ch->lastError();
        s.stats      = ch->stats();
        out.push_back(std::move(s));
    }
    return out;
}
