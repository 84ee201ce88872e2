#pragma once
#include "core/Config.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

// What session.update declares for one session
struct SessionParams {
    std::string targetLang;
    std::string audioFormat = "pcm";
    int         sampleRate  = 16000;
    VadConfig   vad;
};

// Builds outbound protocol messages. Every message gets a fresh event_id
// ("event_1", "event_2", ...). Thread-safe.
class ClientMessageBuilder {
public:
    std::string sessionUpdate(const SessionParams& params);
    std::string appendAudio(const std::vector<uint8_t>& pcm);

    static nlohmann::json sessionObject(const SessionParams& params);

private:
    std::string nextEventId();

    std::atomic<uint64_t> next_{0};
};
