#pragma once
#include <functional>
#include <string>

// One recognised/translated text update from the remote service.
// Built by the session's event classifier, consumed once by the sink.
struct TranslationResult {
    std::string sourceText;       // original-language text, may be empty
    std::string translatedText;   // target-language text, may be empty
    std::string sourceLang = "auto";
    std::string targetLang;
    bool        isFinal = false;  // committed sentence vs live update

    bool operator==(const TranslationResult&) const = default;
};

// Per-session sink (no channel tag)
using ResultCallback = std::function<void(const TranslationResult&)>;

// Supervisor-level sink, tagged with the originating channel name
using ChannelResultCallback =
    std::function<void(const std::string& channel, const TranslationResult&)>;
