#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Error taxonomy. Lifecycle calls (start, addChannel, switchLanguage) throw
// these; background threads log and absorb instead of throwing.
class InterpreterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No capture device matches the requested source/selector
class DeviceNotFound : public InterpreterError {
public:
    using InterpreterError::InterpreterError;
};

// Device exists but the host API refused to open or start it
class DeviceOpenError : public InterpreterError {
public:
    using InterpreterError::InterpreterError;
};

// Transport could not be established, or dropped
class ConnectionError : public InterpreterError {
public:
    using InterpreterError::InterpreterError;
};

// Inbound message is not valid JSON or lacks a type discriminator
class ProtocolParseError : public InterpreterError {
public:
    using InterpreterError::InterpreterError;
};

class DuplicateChannelName : public InterpreterError {
public:
    explicit DuplicateChannelName(const std::string& name)
        : InterpreterError("Duplicate channel name: " + name) {}
};

class UnknownChannel : public InterpreterError {
public:
    explicit UnknownChannel(const std::string& name)
        : InterpreterError("Unknown channel: " + name) {}
};

class MissingCredential : public InterpreterError {
public:
    MissingCredential()
        : InterpreterError("No API key configured. Set DASHSCOPE_API_KEY "
                           "or service.api_key in the config file") {}
};

class ConfigError : public InterpreterError {
public:
    using InterpreterError::InterpreterError;
};

// Raised by SessionSupervisor::stop() after every channel has been asked to
// stop, when one or more of them failed.
class ShutdownError : public InterpreterError {
public:
    using Failure = std::pair<std::string, std::string>;  // channel, message

    explicit ShutdownError(std::vector<Failure> failures)
        : InterpreterError(describe(failures))
        , failures_(std::move(failures)) {}

    const std::vector<Failure>& failures() const { return failures_; }

private:
    static std::string describe(const std::vector<Failure>& failures) {
        std::string msg = "Failed to stop " + std::to_string(failures.size()) +
                          " channel(s):";
        for (auto& [channel, what] : failures)
            msg += " [" + channel + ": " + what + "]";
        return msg;
    }

    std::vector<Failure> failures_;
};
