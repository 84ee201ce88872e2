#include "ui/TerminalUI.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

using namespace ftxui;

namespace {

constexpr int kPaneLines  = 12;   // transcript lines shown per pane
constexpr int kLogLines   = 8;
constexpr auto kTickEvery = std::chrono::milliseconds(250);

Color stateColor(StreamingSession::State s) {
    switch (s) {
        case StreamingSession::State::Streaming:   return Color::Green;
        case StreamingSession::State::Connecting:
        case StreamingSession::State::Configuring: return Color::Yellow;
        case StreamingSession::State::Error:       return Color::Red;
        default:                                   return Color::GrayDark;
    }
}

Element transcriptPane(const std::string& title,
                       const std::vector<std::string>& lines,
                       const std::string& live) {
    Elements rows;
    int liveRows = live.empty() ? 0 : 1;
    int start = std::max(0, (int)lines.size() - (kPaneLines - liveRows));
    for (int i = start; i < (int)lines.size(); i++)
        rows.push_back(paragraph(lines[i]));
    if (!live.empty())
        rows.push_back(paragraph(live) | color(Color::Yellow) | dim);
    if (rows.empty())
        rows.push_back(text("...") | dim);

    return vbox({
        text(" " + title) | bold,
        separator(),
        vbox(rows) | flex,
    }) | flex;
}

Color logColor(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::err:
        case spdlog::level::critical: return Color::Red;
        case spdlog::level::warn:     return Color::Yellow;
        default:                      return Color::GrayLight;
    }
}

} // namespace

TerminalUI::TerminalUI(SessionSupervisor& supervisor, const AppConfig& config)
    : supervisor_(supervisor)
    , config_(config)
{
    for (auto& name : supervisor_.channelNames())
        transcriptFor(name);
}

TerminalUI::~TerminalUI() {
    stop();
    if (actionThread_.joinable())
        actionThread_.join();
}

TranscriptBuffer& TerminalUI::transcriptFor(const std::string& channel) {
    std::lock_guard lock(transcriptMtx_);
    auto& slot = transcripts_[channel];
    if (!slot)
        slot = std::make_unique<TranscriptBuffer>(config_.ui.maxTranscriptLines);
    return *slot;
}

void TerminalUI::clearTranscripts() {
    std::lock_guard lock(transcriptMtx_);
    for (auto& [name, buffer] : transcripts_)
        buffer->clear();
}

void TerminalUI::onResult(const std::string& channel, const TranslationResult& result) {
    transcriptFor(channel).apply(result);
    requestRedraw();
}

void TerminalUI::addLog(spdlog::level::level_enum level, const std::string& line) {
    {
        std::lock_guard lock(logMtx_);
        logs_.push_back({level, line});
        if (logs_.size() > maxLogs_)
            logs_.pop_front();
    }
    requestRedraw();
}

void TerminalUI::requestRedraw() {
    std::lock_guard lock(screenMtx_);
    if (screen_) screen_->PostEvent(Event::Custom);
}

void TerminalUI::stop() {
    stopRequested_ = true;
}

void TerminalUI::runAction(const std::string& what, std::function<void()> action) {
    if (busy_) {
        spdlog::warn("UI: still busy, ignoring {}", what);
        return;
    }
    if (actionThread_.joinable())
        actionThread_.join();

    busy_ = true;
    actionThread_ = std::thread([this, what, action = std::move(action)] {
        try {
            action();
        } catch (const std::exception& e) {
            spdlog::error("UI: {} failed: {}", what, e.what());
        }
        busy_ = false;
        requestRedraw();
    });
}

void TerminalUI::run() {
    auto screen = ScreenInteractive::Fullscreen();
    {
        std::lock_guard lock(screenMtx_);
        screen_ = &screen;
    }

    // Periodic tick for the status line and for stop() from signal context
    std::atomic<bool> ticking{true};
    std::thread ticker([&] {
        while (ticking) {
            std::this_thread::sleep_for(kTickEvery);
            screen.PostEvent(Event::Custom);
        }
    });

    auto renderer = Renderer([&] {
        auto channels = supervisor_.status();
        if (!channels.empty())
            selected_ = std::min(selected_, (int)channels.size() - 1);

        // ── Header ────────────────────────────────────────────────
        bool running = supervisor_.isRunning();
        auto header = hbox({
            text(" Live Interpreter ") | bold | color(Color::Cyan) | inverted,
            text(" "),
            text(running ? "running" : "stopped") |
                color(running ? Color::Green : Color::GrayDark),
            busy_ ? text("  working...") | color(Color::Yellow) : text(""),
            filler(),
            text(config_.service.model + " ") | dim,
        });

        // ── Channels ──────────────────────────────────────────────
        Elements channelElements;
        for (size_t i = 0; i < channels.size(); i++) {
            auto& ch = channels[i];
            auto snap = transcriptFor(ch.name).snapshot();
            bool selected = (int)i == selected_;

            auto status = hbox({
                text(selected ? "> " : "  "),
                text(ch.name) | bold,
                text(" [" + sourceTypeToString(ch.sourceType) + "] ") | dim,
                text(StreamingSession::stateName(ch.state)) | color(stateColor(ch.state)),
                text("  -> " + languageLabel(config_.languages, ch.targetLang)),
                filler(),
                text(ch.deviceName.empty() ? "" : ch.deviceName + "  ") | dim,
                text("sent " + std::to_string(ch.stats.framesSent) +
                     " drop " + std::to_string(ch.stats.framesDropped) +
                     " res " + std::to_string(ch.stats.resultsDelivered) + " ") | dim,
            });
            if (selected) status = status | inverted;

            Elements body = {
                status,
                separator(),
                hbox({
                    transcriptPane("Source", snap.source, snap.liveSource),
                    separator(),
                    transcriptPane("Translation (" + ch.targetLang + ")",
                                   snap.translation, snap.liveTranslation),
                }) | flex,
            };
            if (ch.state == StreamingSession::State::Error && !ch.lastError.empty())
                body.push_back(text(" " + ch.lastError) | color(Color::Red));

            channelElements.push_back(vbox(body) | border | flex);
        }
        if (channelElements.empty())
            channelElements.push_back(text("  No channels configured") | dim);

        // ── Activity Log ──────────────────────────────────────────
        Elements logElements;
        {
            std::lock_guard lock(logMtx_);
            int logStart = std::max(0, (int)logs_.size() - kLogLines);
            for (int i = logStart; i < (int)logs_.size(); i++)
                logElements.push_back(text("  " + logs_[i].text) |
                                      color(logColor(logs_[i].level)));
        }

        return vbox({
            header,
            separator(),
            vbox(channelElements) | flex,
            vbox({
                text(" Activity") | bold,
                separator(),
                vbox(logElements),
            }) | size(HEIGHT, EQUAL, kLogLines + 3) | border,
            hbox({
                text(" [l] language  [Tab] channel  [c] clear  "
                     "[s] start/stop  [q] quit ") | dim,
            }) | borderLight,
        });
    });

    auto component = CatchEvent(renderer, [&](Event event) {
        if (event == Event::Custom) {
            if (stopRequested_) screen.Exit();
            return false;
        }

        auto names = supervisor_.channelNames();

        if (event == Event::Character('q') || event == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (event == Event::Tab) {
            if (!names.empty())
                selected_ = (selected_ + 1) % (int)names.size();
            return true;
        }
        if (event == Event::Character('c')) {
            clearTranscripts();
            return true;
        }
        if (event == Event::Character('s')) {
            if (supervisor_.isRunning())
                runAction("stop", [this] { supervisor_.stop(); });
            else
                runAction("start", [this] { supervisor_.start(); });
            return true;
        }
        if (event == Event::Character('l')) {
            if (names.empty()) return true;
            std::string channel = names[std::min(selected_, (int)names.size() - 1)];

            std::string current = config_.ui.defaultTargetLang;
            for (auto& s : supervisor_.status())
                if (s.name == channel) current = s.targetLang;

            std::string next = nextLanguage(config_.languages, current);
            runAction("language switch", [this, channel, next] {
                supervisor_.switchLanguage(channel, next);
            });
            return true;
        }
        return false;
    });

    screen.Loop(component);

    ticking = false;
    ticker.join();
    {
        std::lock_guard lock(screenMtx_);
        screen_ = nullptr;
    }
}
