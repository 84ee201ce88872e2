#pragma once
#include "core/TranslationResult.hpp"
#include <optional>
#include <string>
#include <variant>

// Inbound events of the realtime livetranslate protocol, one struct per kind.

struct SessionCreatedEvent {
    std::string sessionId;
};

struct SessionUpdatedEvent {};

// input_audio_buffer.speech_started / speech_stopped
struct SpeechMarkerEvent {
    bool started = false;
};

// committed, response.created, response.done: no payload we care about
struct LifecycleEvent {
    std::string type;
};

// conversation.item.input_audio_transcription.text
struct TranscriptInterimEvent {
    std::string text;   // "stash", falling back to "text"
};

// conversation.item.input_audio_transcription.completed
struct TranscriptFinalEvent {
    std::string transcript;
    std::string translation;   // only when the server bundles it
};

// response.text.delta
struct TranslationDeltaEvent {
    std::string delta;
};

// response.text.done
struct TranslationFinalEvent {
    std::string text;
};

struct ErrorEvent {
    std::string code;
    std::string message;
};

struct UnknownEvent {
    std::string type;
};

using ServerEvent = std::variant<
    SessionCreatedEvent,
    SessionUpdatedEvent,
    SpeechMarkerEvent,
    LifecycleEvent,
    TranscriptInterimEvent,
    TranscriptFinalEvent,
    TranslationDeltaEvent,
    TranslationFinalEvent,
    ErrorEvent,
    UnknownEvent>;

// Throws ProtocolParseError on invalid JSON, a missing/non-string "type", or a
// payload field of the wrong JSON type.
ServerEvent parseServerEventOrThrow(const std::string& raw);

// Logs and returns nullopt instead of throwing
std::optional<ServerEvent> parseServerEvent(const std::string& raw);

// Per-session context handed to the classifier
struct ChannelContext {
    std::string channelName;
    std::string targetLang;
    std::string sourceLang = "auto";
};

// Maps one event to zero or one result. Lifecycle, VAD and error events and
// events with empty text produce none; errors are logged here.
std::optional<TranslationResult> classifyEvent(const ServerEvent& event,
                                               const ChannelContext& ctx);
