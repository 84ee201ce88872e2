#include "audio/NullAudioBackend.hpp"
#include "audio/PortAudioBackend.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "pipeline/SessionSupervisor.hpp"
#include "transport/WebSocketTransport.hpp"
#include "ui/TerminalUI.hpp"
#include "ui/UiLogSink.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <optional>
#include <thread>

static std::atomic<bool> g_quit{false};
static std::atomic<TerminalUI*> g_ui{nullptr};

static void signalHandler(int) {
    g_quit = true;
    if (auto* ui = g_ui.load()) ui->stop();
}

struct CliOptions {
    std::string configPath = "config/interpreter.json";
    std::optional<SourceType> source;
    std::optional<int> device;
    std::string target;
    bool headless    = false;
    bool listDevices = false;
};

static void printUsage(const char* argv0) {
    std::printf("Usage: %s [config.json] [--source mic|system|both] [--device <id>]\n"
                "       [--target <lang>] [--headless] [--list-devices]\n", argv0);
}

// Returns false on a usage error
static bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto needValue = [&]() -> const char* {
            return i + 1 < argc ? argv[++i] : nullptr;
        };

        if (arg == "--headless") {
            opts.headless = true;
        } else if (arg == "--list-devices") {
            opts.listDevices = true;
        } else if (arg == "--source") {
            const char* v = needValue();
            if (!v) return false;
            opts.source = sourceTypeFromString(v);
            if (!opts.source) {
                std::fprintf(stderr, "Unknown source type: %s\n", v);
                return false;
            }
        } else if (arg == "--device") {
            const char* v = needValue();
            if (!v) return false;
            try {
                opts.device = std::stoi(v);
            } catch (const std::exception&) {
                std::fprintf(stderr, "Invalid device id: %s\n", v);
                return false;
            }
        } else if (arg == "--target") {
            const char* v = needValue();
            if (!v) return false;
            opts.target = v;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg[0] != '-') {
            opts.configPath = arg;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            return false;
        }
    }
    return true;
}

static void printDevices(const std::vector<DeviceDescriptor>& devices) {
    if (devices.empty()) {
        std::printf("No capture devices found\n");
        return;
    }
    for (auto& d : devices) {
        std::printf("[%3d] %-48s %2dch %6.0fHz %-10s %s\n", d.id,
                    d.displayName.c_str(), d.channelCount, d.nativeSampleRate,
                    d.hostApi.c_str(), d.isLoopback ? "loopback" : "input");
    }
}

int main(int argc, char* argv[]) {
    // Load .env file
    loadDotEnv(".env");

    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 2;
    }

    // Setup logging. The full-screen UI owns stdout, so interactive runs
    // mirror log lines into its activity feed instead.
    bool interactive = !opts.headless && !opts.listDevices;

    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "live-interpreter.log", 1048576 * 5, 3);  // 5MB, 3 files

    std::vector<spdlog::sink_ptr> sinks{fileSink};
    if (interactive) {
        sinks.push_back(std::make_shared<UiLogSinkMt>(
            [](spdlog::level::level_enum level, const std::string& line) {
                if (auto* ui = g_ui.load()) ui->addLog(level, line);
            }));
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("liveinterp", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    std::string logLevel = getEnv("LIVEINTERP_LOG_LEVEL", "info");
    if (logLevel == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (logLevel == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (logLevel == "error") spdlog::set_level(spdlog::level::err);
    else                          spdlog::set_level(spdlog::level::info);

    spdlog::info("Live Interpreter v0.1.0 starting");

    AppConfig config;
    try {
        config = loadAppConfig(opts.configPath);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    if (opts.headless) config.ui.headless = true;
    if (!opts.target.empty()) config.ui.defaultTargetLang = opts.target;

    // Audio backend
    std::shared_ptr<IAudioBackend> backend;
    {
        auto pa = std::make_shared<PortAudioBackend>();
        if (pa->initialized()) {
            backend = pa;
        } else {
            spdlog::warn("Audio: PortAudio unavailable, running without capture devices");
            backend = std::make_shared<NullAudioBackend>();
        }
    }

    SessionSupervisor supervisor(config, backend,
        WebSocketTransport::factory(static_cast<size_t>(config.service.maxQueuedFrames)));

    if (opts.listDevices) {
        printDevices(supervisor.enumerateDevices());
        return 0;
    }

    // Channels: "both" becomes a microphone and a system channel
    SourceType source = opts.source.value_or(SourceType::Microphone);
    try {
        const std::string& target = config.ui.defaultTargetLang;
        if (source == SourceType::Both) {
            supervisor.addChannel({"mic", target, SourceType::Microphone, std::nullopt});
            supervisor.addChannel({"system", target, SourceType::SystemLoopback, std::nullopt});
            if (opts.device)
                spdlog::warn("--device is ignored with --source both");
        } else {
            std::string name = source == SourceType::Microphone ? "mic" : "system";
            supervisor.addChannel({name, target, source, opts.device});
        }
    } catch (const InterpreterError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    // Setup signal handlers
    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    int exitCode = 0;
    std::unique_ptr<TerminalUI> ui;   // outlives the supervisor's last result

    if (config.ui.headless) {
        supervisor.setResultSink([](const std::string& channel, const TranslationResult& r) {
            if (!r.isFinal) return;
            if (!r.sourceText.empty())
                spdlog::info("[{}] {}: {}", channel, r.sourceLang, r.sourceText);
            if (!r.translatedText.empty())
                spdlog::info("[{}] {}: {}", channel, r.targetLang, r.translatedText);
        });

        try {
            supervisor.start();
        } catch (const InterpreterError& e) {
            spdlog::error("Failed to start: {}", e.what());
            return 1;
        }
        spdlog::info("Interpreter running, press Ctrl+C to stop");

        while (!g_quit) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            bool anyRunning = false;
            for (auto& s : supervisor.status())
                anyRunning = anyRunning || s.running;
            if (!anyRunning) {
                spdlog::error("All channels stopped, exiting");
                exitCode = 1;
                break;
            }
        }
    } else {
        ui = std::make_unique<TerminalUI>(supervisor, config);
        supervisor.setResultSink([&ui](const std::string& channel, const TranslationResult& r) {
            ui->onResult(channel, r);
        });
        g_ui = ui.get();

        // Start in the background so the UI is up while connecting
        std::thread starter([&supervisor] {
            try {
                supervisor.start();
            } catch (const InterpreterError& e) {
                spdlog::error("Failed to start: {} (press [s] to retry)", e.what());
            }
        });

        ui->run();
        starter.join();
    }

    try {
        supervisor.stop();
    } catch (const ShutdownError& e) {
        spdlog::error("{}", e.what());
        exitCode = 1;
    }
    g_ui = nullptr;

    spdlog::info("Live Interpreter exiting (code {})", exitCode);
    return exitCode;
}
