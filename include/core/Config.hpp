#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Remote recognize+translate service
struct ServiceConfig {
    std::string apiKey;
    std::string websocketUrl   = "wss://dashscope.aliyuncs.com/api-ws/v1/realtime";
    std::string model          = "qwen3-livetranslate-flash-realtime";
    int         connectTimeoutMs = 10000;
    int         closeTimeoutMs   = 3000;   // bounded join on session stop

    // Wait for session.updated before accepting audio. The livetranslate
    // endpoint accepts audio straight after session.update, so off by default.
    bool        requireConfigAck = false;

    int         maxQueuedFrames = 50;   // outbound audio bound (~5s at 100ms)
};

struct AudioConfig {
    int         sampleRate     = 16000;  // wire sample rate, mono s16le
    std::string format         = "pcm";
    int         chunkMs        = 100;    // wall-clock duration of one frame
    int         stopTimeoutMs  = 3000;   // bounded join on capture stop
};

// Server-side voice activity detection
struct VadConfig {
    bool  enabled           = true;
    float threshold         = 0.0f;
    int   silenceDurationMs = 400;
};

struct UiConfig {
    std::string defaultTargetLang = "en";
    size_t      maxTranscriptLines = 500;
    bool        headless = false;
};

struct LanguageOption {
    std::string code;
    std::string label;
};

struct AppConfig {
    ServiceConfig service;
    AudioConfig   audio;
    VadConfig     vad;
    UiConfig      ui;
    std::vector<LanguageOption> languages = defaultLanguages();

    static std::vector<LanguageOption> defaultLanguages();

    // Missing keys keep their defaults
    static AppConfig fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

// Code after `current` in the list, wrapping around. The first entry when
// `current` is not listed; `current` itself when the list is empty.
std::string nextLanguage(const std::vector<LanguageOption>& languages,
                         const std::string& current);

// Display label for a code, the code itself when unknown
std::string languageLabel(const std::vector<LanguageOption>& languages,
                          const std::string& code);

// Defaults -> primary file -> user overlay (merge-patch) -> environment.
// A missing file is skipped; a file that is not valid JSON throws ConfigError.
AppConfig loadAppConfig(const std::string& path,
                        const std::string& userOverlayPath = "user_settings.json");

// API key from config, falling back to DASHSCOPE_API_KEY. Empty if neither.
std::string resolveApiKey(const ServiceConfig& service);

// KEY=VALUE lines into the environment, never overriding existing variables
void loadDotEnv(const std::string& path);

std::string getEnv(const std::string& key, const std::string& defaultVal = "");
