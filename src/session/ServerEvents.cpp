#include "session/ServerEvents.hpp"
#include "core/Errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_string())
        throw ProtocolParseError(std::string("field '") + key + "' is not a string");
    return it->get<std::string>();
}

} // namespace

ServerEvent parseServerEventOrThrow(const std::string& raw) {
    json j;
    try {
        j = json::parse(raw);
    } catch (const json::parse_error& e) {
        throw ProtocolParseError(std::string("invalid JSON: ") + e.what());
    }

    if (!j.is_object())
        throw ProtocolParseError("message is not a JSON object");

    auto typeIt = j.find("type");
    if (typeIt == j.end() || !typeIt->is_string())
        throw ProtocolParseError("message has no string 'type'");
    const std::string type = typeIt->get<std::string>();

    if (type == "session.created") {
        SessionCreatedEvent ev;
        if (auto s = j.find("session"); s != j.end() && s->is_object())
            ev.sessionId = stringField(*s, "id");
        return ev;
    }
    if (type == "session.updated")
        return SessionUpdatedEvent{};
    if (type == "input_audio_buffer.speech_started")
        return SpeechMarkerEvent{true};
    if (type == "input_audio_buffer.speech_stopped")
        return SpeechMarkerEvent{false};
    if (type == "input_audio_buffer.committed" ||
        type == "response.created" || type == "response.done")
        return LifecycleEvent{type};

    if (type == "conversation.item.input_audio_transcription.text") {
        std::string text = stringField(j, "stash");
        if (text.empty()) text = stringField(j, "text");
        return TranscriptInterimEvent{text};
    }
    if (type == "conversation.item.input_audio_transcription.completed")
        return TranscriptFinalEvent{stringField(j, "transcript"),
                                    stringField(j, "translation")};
    if (type == "response.text.delta")
        return TranslationDeltaEvent{stringField(j, "delta")};
    if (type == "response.text.done")
        return TranslationFinalEvent{stringField(j, "text")};

    if (type == "error") {
        ErrorEvent ev;
        auto e = j.find("error");
        if (e != j.end() && e->is_object()) {
            ev.message = stringField(*e, "message");
            if (auto c = e->find("code"); c != e->end())
                ev.code = c->is_string() ? c->get<std::string>() : c->dump();
        } else {
            ev.message = stringField(j, "message");
        }
        return ev;
    }

    return UnknownEvent{type};
}

std::optional<ServerEvent> parseServerEvent(const std::string& raw) {
    try {
        return parseServerEventOrThrow(raw);
    } catch (const ProtocolParseError& e) {
        spdlog::warn("Protocol: skipping malformed message: {}", e.what());
        return std::nullopt;
    }
}

std::optional<TranslationResult> classifyEvent(const ServerEvent& event,
                                               const ChannelContext& ctx) {
    auto make = [&](std::string source, std::string translated, bool isFinal) {
        TranslationResult r;
        r.sourceText     = std::move(source);
        r.translatedText = std::move(translated);
        r.sourceLang     = ctx.sourceLang;
        r.targetLang     = ctx.targetLang;
        r.isFinal        = isFinal;
        return r;
    };

    return std::visit(Overloaded{
        [&](const SessionCreatedEvent& e) -> std::optional<TranslationResult> {
            spdlog::info("Session[{}]: created {}", ctx.channelName, e.sessionId);
            return std::nullopt;
        },
        [&](const SessionUpdatedEvent&) -> std::optional<TranslationResult> {
            spdlog::debug("Session[{}]: configuration acknowledged", ctx.channelName);
            return std::nullopt;
        },
        [&](const SpeechMarkerEvent& e) -> std::optional<TranslationResult> {
            spdlog::debug("Session[{}]: speech {}", ctx.channelName,
                          e.started ? "started" : "stopped");
            return std::nullopt;
        },
        [&](const LifecycleEvent&) -> std::optional<TranslationResult> {
            return std::nullopt;
        },
        [&](const TranscriptInterimEvent& e) -> std::optional<TranslationResult> {
            if (e.text.empty()) return std::nullopt;
            return make(e.text, "", false);
        },
        [&](const TranscriptFinalEvent& e) -> std::optional<TranslationResult> {
            if (e.transcript.empty() && e.translation.empty()) return std::nullopt;
            return make(e.transcript, e.translation, true);
        },
        [&](const TranslationDeltaEvent& e) -> std::optional<TranslationResult> {
            if (e.delta.empty()) return std::nullopt;
            return make("", e.delta, false);
        },
        [&](const TranslationFinalEvent& e) -> std::optional<TranslationResult> {
            if (e.text.empty()) return std::nullopt;
            return make("", e.text, true);
        },
        [&](const ErrorEvent& e) -> std::optional<TranslationResult> {
            spdlog::error("Session[{}]: server error {}: {}", ctx.channelName,
                          e.code.empty() ? "-" : e.code, e.message);
            return std::nullopt;
        },
        [&](const UnknownEvent& e) -> std::optional<TranslationResult> {
            spdlog::debug("Session[{}]: ignoring event '{}'", ctx.channelName, e.type);
            return std::nullopt;
        },
    }, event);
}
