#include "core/Config.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

namespace {

nlohmann::json readJsonFile(const std::string& path, bool& found) {
    found = false;
    std::ifstream f(path);
    if (!f.is_open()) return nlohmann::json::object();
    found = true;

    try {
        nlohmann::json j;
        f >> j;
        if (!j.is_object())
            throw ConfigError("Config root must be an object: " + path);
        return j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid JSON in " + path + ": " + e.what());
    }
}

// Missing key -> fallback; present with the wrong type -> ConfigError
template<typename T>
T field(const nlohmann::json& obj, const char* key, const T& fallback) {
    try {
        return obj.value(key, fallback);
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(std::string("Config key '") + key + "' has the wrong type: " +
                          e.what());
    }
}

} // namespace

std::vector<LanguageOption> AppConfig::defaultLanguages() {
    return {
        {"zh", "中文"},
        {"en", "English"},
        {"ja", "日本語"},
        {"ko", "한국어"},
        {"fr", "Français"},
        {"de", "Deutsch"},
        {"es", "Español"},
    };
}

AppConfig AppConfig::fromJson(const nlohmann::json& j) {
    AppConfig c;

    if (auto it = j.find("service"); it != j.end() && it->is_object()) {
        auto& s = *it;
        c.service.apiKey           = field(s, "api_key", c.service.apiKey);
        c.service.websocketUrl     = field(s, "websocket_url", c.service.websocketUrl);
        c.service.model            = field(s, "model", c.service.model);
        c.service.connectTimeoutMs = field(s, "connect_timeout_ms", c.service.connectTimeoutMs);
        c.service.closeTimeoutMs   = field(s, "close_timeout_ms", c.service.closeTimeoutMs);
        c.service.requireConfigAck = field(s, "require_config_ack", c.service.requireConfigAck);
        c.service.maxQueuedFrames  = field(s, "max_queued_frames", c.service.maxQueuedFrames);
    }

    if (auto it = j.find("audio"); it != j.end() && it->is_object()) {
        auto& a = *it;
        c.audio.sampleRate    = field(a, "sample_rate", c.audio.sampleRate);
        c.audio.format        = field(a, "format", c.audio.format);
        c.audio.chunkMs       = field(a, "chunk_ms", c.audio.chunkMs);
        c.audio.stopTimeoutMs = field(a, "stop_timeout_ms", c.audio.stopTimeoutMs);
    }

    if (auto it = j.find("vad"); it != j.end() && it->is_object()) {
        auto& v = *it;
        c.vad.enabled           = field(v, "enabled", c.vad.enabled);
        c.vad.threshold         = field(v, "threshold", c.vad.threshold);
        c.vad.silenceDurationMs = field(v, "silence_duration_ms", c.vad.silenceDurationMs);
    }

    if (auto it = j.find("ui"); it != j.end() && it->is_object()) {
        auto& u = *it;
        c.ui.defaultTargetLang  = field(u, "default_target_lang", c.ui.defaultTargetLang);
        c.ui.maxTranscriptLines = field(u, "max_transcript_lines", c.ui.maxTranscriptLines);
        c.ui.headless           = field(u, "headless", c.ui.headless);
    }

    if (auto it = j.find("languages"); it != j.end() && it->is_array()) {
        c.languages.clear();
        for (auto& l : *it) {
            if (!l.is_object() || !l.contains("code")) continue;
            auto code = field(l, "code", std::string());
            c.languages.push_back({code, field(l, "label", code)});
        }
        if (c.languages.empty())
            c.languages = defaultLanguages();
    }

    if (c.audio.sampleRate <= 0)
        throw ConfigError("audio.sample_rate must be positive");
    if (c.audio.chunkMs <= 0)
        throw ConfigError("audio.chunk_ms must be positive");

    return c;
}

nlohmann::json AppConfig::toJson() const {
    nlohmann::json langs = nlohmann::json::array();
    for (auto& l : languages)
        langs.push_back({{"code", l.code}, {"label", l.label}});

    // api_key is never written back
    return {
        {"service", {
            {"websocket_url",      service.websocketUrl},
            {"model",              service.model},
            {"connect_timeout_ms", service.connectTimeoutMs},
            {"close_timeout_ms",   service.closeTimeoutMs},
            {"require_config_ack", service.requireConfigAck},
            {"max_queued_frames",  service.maxQueuedFrames},
        }},
        {"audio", {
            {"sample_rate",     audio.sampleRate},
            {"format",          audio.format},
            {"chunk_ms",        audio.chunkMs},
            {"stop_timeout_ms", audio.stopTimeoutMs},
        }},
        {"vad", {
            {"enabled",             vad.enabled},
            {"threshold",           vad.threshold},
            {"silence_duration_ms", vad.silenceDurationMs},
        }},
        {"ui", {
            {"default_target_lang",  ui.defaultTargetLang},
            {"max_transcript_lines", ui.maxTranscriptLines},
            {"headless",             ui.headless},
        }},
        {"languages", langs},
    };
}

std::string nextLanguage(const std::vector<LanguageOption>& languages,
                         const std::string& current) {
    if (languages.empty()) return current;
    for (size_t i = 0; i < languages.size(); i++) {
        if (languages[i].code == current)
            return languages[(i + 1) % languages.size()].code;
    }
    return languages.front().code;
}

std::string languageLabel(const std::vector<LanguageOption>& languages,
                          const std::string& code) {
    for (auto& l : languages)
        if (l.code == code) return l.label;
    return code;
}

AppConfig loadAppConfig(const std::string& path,
                        const std::string& userOverlayPath) {
    bool found = false;
    nlohmann::json merged = readJsonFile(path, found);
    if (found)
        spdlog::info("Loaded config: {}", path);
    else
        spdlog::warn("Config file {} not found, using defaults", path);

    if (!userOverlayPath.empty()) {
        nlohmann::json user = readJsonFile(userOverlayPath, found);
        if (found) {
            merged.merge_patch(user);
            spdlog::info("Applied user settings: {}", userOverlayPath);
        }
    }

    AppConfig config = AppConfig::fromJson(merged);
    config.service.apiKey = resolveApiKey(config.service);
    return config;
}

std::string resolveApiKey(const ServiceConfig& service) {
    if (!service.apiKey.empty()) return service.apiKey;
    return getEnv("DASHSCOPE_API_KEY");
}

std::string getEnv(const std::string& key, const std::string& defaultVal) {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

void loadDotEnv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        // Remove quotes
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);  // don't override existing
    }
}
