#pragma once
#include "AudioTypes.hpp"
#include "IAudioBackend.hpp"
#include "PcmConverter.hpp"
#include "core/Config.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Receives one normalised chunk (mono s16le at the target rate), in capture
// order, on the capture thread.
using FrameCallback = std::function<void(const std::vector<uint8_t>& pcm)>;

// One running capture: a device stream plus the dedicated thread that owns it.
// Returned by AudioSource::start().
//
// stop() waits a bounded time for the thread. A thread still blocked in the
// device read after that is detached and exits on its own once the read
// returns; it never invokes the frame callback after stop() was requested.
class CaptureHandle {
    struct Loop;
    struct Token {};   // only AudioSource constructs handles

public:
    enum class State { Running, Stopping, Stopped };

    CaptureHandle(Token, DeviceDescriptor device, std::shared_ptr<Loop> loop,
                  std::chrono::milliseconds stopTimeout);
    ~CaptureHandle();

    CaptureHandle(const CaptureHandle&) = delete;
    CaptureHandle& operator=(const CaptureHandle&) = delete;

    // Idempotent
    void stop();

    // False once stopped or once the capture loop died on a read error
    bool isRunning() const;

    State state() const;
    const DeviceDescriptor& device() const { return device_; }
    uint64_t framesDelivered() const;

private:
    friend class AudioSource;

    // Shared with the capture thread so an abandoned thread stays valid.
    // Holds the backend so the host API outlives an abandoned stream.
    struct Loop {
        std::shared_ptr<IAudioBackend> backend;
        std::unique_ptr<IInputStream> stream;
        PcmConverter      converter;
        int               framesPerRead;
        FrameCallback     onFrame;
        std::string       deviceName;
        std::atomic<bool> stopRequested{false};
        std::atomic<bool> alive{true};
        std::atomic<uint64_t> delivered{0};
        std::promise<void> exited;

        Loop(std::shared_ptr<IAudioBackend> b, std::unique_ptr<IInputStream> s,
             PcmConverter c, int frames, FrameCallback cb, std::string name)
            : backend(std::move(b)), stream(std::move(s)), converter(c), framesPerRead(frames)
            , onFrame(std::move(cb)), deviceName(std::move(name)) {}
    };

    static void run(std::shared_ptr<Loop> loop);

    DeviceDescriptor          device_;
    std::shared_ptr<Loop>     loop_;
    std::chrono::milliseconds stopTimeout_;
    std::thread               thread_;
    std::future<void>         exited_;

    mutable std::mutex mtx_;   // guards state_ transitions
    State              state_ = State::Running;
};

// Device enumeration, selection policy and capture start/stop for one
// physical source. Thread-safe; holds no per-capture state itself.
class AudioSource {
public:
    AudioSource(std::shared_ptr<IAudioBackend> backend, const AudioConfig& config);

    // Inputs followed by loopbacks. A sub-category that fails to enumerate
    // is skipped with a warning.
    std::vector<DeviceDescriptor> enumerate() const;

    // Selection: explicit selector if valid, else the default input
    // (microphone) or the loopback of the default output (system).
    // Throws DeviceNotFound.
    DeviceDescriptor resolve(SourceType type,
                             std::optional<int> selector = std::nullopt) const;

    // Opens the device at its native format and starts the capture thread.
    // Throws DeviceOpenError.
    std::shared_ptr<CaptureHandle> start(const DeviceDescriptor& device,
                                         int targetSampleRate,
                                         FrameCallback onFrame);

    // Idempotent; a null handle is a no-op
    void stop(const std::shared_ptr<CaptureHandle>& handle);

    // Loopback whose name contains the output's name, else one containing
    // its first 15 characters.
    static std::optional<DeviceDescriptor> matchLoopback(
        const std::string& outputName,
        const std::vector<DeviceDescriptor>& candidates);

    static constexpr size_t kFuzzyPrefixLength = 15;

    const IAudioBackend& backend() const { return *backend_; }

private:
    DeviceDescriptor resolveLoopback() const;

    std::shared_ptr<IAudioBackend> backend_;
    AudioConfig config_;
};
