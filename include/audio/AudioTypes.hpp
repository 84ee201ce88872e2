#pragma once
#include <optional>
#include <string>

enum class SourceType {
    Microphone,
    SystemLoopback,
    Both            // expanded into two channels by the front-end
};

inline std::string sourceTypeToString(SourceType t) {
    switch (t) {
        case SourceType::Microphone:     return "microphone";
        case SourceType::SystemLoopback: return "system-loopback";
        case SourceType::Both:           return "both";
    }
    return "unknown";
}

// Accepts the long names plus the short CLI aliases
inline std::optional<SourceType> sourceTypeFromString(const std::string& s) {
    if (s == "microphone" || s == "mic")
        return SourceType::Microphone;
    if (s == "system-loopback" || s == "system" || s == "speaker" || s == "loopback")
        return SourceType::SystemLoopback;
    if (s == "both")
        return SourceType::Both;
    return std::nullopt;
}

// Snapshot of one capture device. Produced fresh by every enumeration.
struct DeviceDescriptor {
    int         id = -1;            // host API device index
    std::string displayName;
    int         channelCount = 0;   // max input channels
    double      nativeSampleRate = 0;
    bool        isLoopback = false;
    std::string hostApi;

    bool operator==(const DeviceDescriptor&) const = default;
};
