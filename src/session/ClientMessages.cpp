#include "session/ClientMessages.hpp"
#include "util/Base64.hpp"

using json = nlohmann::json;

std::string ClientMessageBuilder::nextEventId() {
    return "event_" + std::to_string(++next_);
}

json ClientMessageBuilder::sessionObject(const SessionParams& params) {
    json turnDetection = nullptr;
    if (params.vad.enabled) {
        turnDetection = {
            {"type", "server_vad"},
            {"threshold", params.vad.threshold},
            {"silence_duration_ms", params.vad.silenceDurationMs},
        };
    }

    return {
        {"modalities", json::array({"text"})},
        {"input_audio_format", params.audioFormat},
        {"sample_rate", params.sampleRate},
        {"input_audio_transcription", {{"language", "auto"}}},
        {"translation", {{"language", params.targetLang}}},
        {"turn_detection", turnDetection},
    };
}

std::string ClientMessageBuilder::sessionUpdate(const SessionParams& params) {
    json msg = {
        {"event_id", nextEventId()},
        {"type", "session.update"},
        {"session", sessionObject(params)},
    };
    return msg.dump();
}

std::string ClientMessageBuilder::appendAudio(const std::vector<uint8_t>& pcm) {
    json msg = {
        {"event_id", nextEventId()},
        {"type", "input_audio_buffer.append"},
        {"audio", base64Encode(pcm.data(), pcm.size())},
    };
    return msg.dump();
}
