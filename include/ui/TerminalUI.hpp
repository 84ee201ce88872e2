#pragma once
#include "core/Config.hpp"
#include "core/TranslationResult.hpp"
#include "pipeline/SessionSupervisor.hpp"
#include "pipeline/TranscriptBuffer.hpp"
#include <spdlog/common.h>
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ftxui { class ScreenInteractive; }

// Full-screen ftxui front-end: one source | translation pane pair per
// channel, a status line per channel and an activity log.
//
// Keys: [l] next target language for the selected channel, [Tab] next
// channel, [c] clear transcripts, [s] start/stop, [q] quit.
class TerminalUI {
public:
    TerminalUI(SessionSupervisor& supervisor, const AppConfig& config);
    ~TerminalUI();

    TerminalUI(const TerminalUI&) = delete;
    TerminalUI& operator=(const TerminalUI&) = delete;

    // Result sink for the supervisor. Thread-safe.
    void onResult(const std::string& channel, const TranslationResult& result);

    // Activity feed line, fed by the log sink. Thread-safe.
    void addLog(spdlog::level::level_enum level, const std::string& line);

    // Interactive loop (blocks until [q] or stop())
    void run();

    // Only sets a flag, so it may be called from a signal handler
    void stop();

private:
    struct LogLine {
        spdlog::level::level_enum level;
        std::string               text;
    };

    TranscriptBuffer& transcriptFor(const std::string& channel);
    void clearTranscripts();
    void requestRedraw();
    void runAction(const std::string& what, std::function<void()> action);

    SessionSupervisor& supervisor_;
    AppConfig          config_;

    std::mutex transcriptMtx_;
    std::map<std::string, std::unique_ptr<TranscriptBuffer>> transcripts_;

    std::mutex          logMtx_;
    std::deque<LogLine> logs_;
    static constexpr size_t maxLogs_ = 50;

    std::mutex                screenMtx_;
    ftxui::ScreenInteractive* screen_ = nullptr;

    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> busy_{false};    // a start/stop/switch is in progress
    std::thread       actionThread_;
    int               selected_ = 0;   // UI thread only
};
