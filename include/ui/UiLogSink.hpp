#pragma once
#include <spdlog/sinks/base_sink.h>
#include <functional>
#include <mutex>
#include <string>

// Forwards formatted log lines to a callback, used to mirror logs into the
// full-screen UI instead of writing to stdout underneath it.
template <typename Mutex>
class UiLogSink : public spdlog::sinks::base_sink<Mutex> {
public:
    using LineCallback = std::function<void(spdlog::level::level_enum, const std::string&)>;

    explicit UiLogSink(LineCallback onLine) : onLine_(std::move(onLine)) {
        this->set_pattern("%H:%M:%S %L %v");
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        this->formatter_->format(msg, formatted);
        std::string line(formatted.data(), formatted.size());
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
            line.pop_back();
        if (onLine_) onLine_(msg.level, line);
    }

    void flush_() override {}

private:
    LineCallback onLine_;
};

using UiLogSinkMt = UiLogSink<std::mutex>;
