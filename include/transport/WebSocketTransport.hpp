#pragma once
#include "IRealtimeTransport.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

// WebSocket transport over Boost.Beast, TLS via OpenSSL for wss://.
// The io_context runs inside run(); cross-thread send()/close() are posted to
// it so the socket has a single owner.
class WebSocketTransport : public IRealtimeTransport {
public:
    struct Url {
        bool        secure = true;
        std::string host;
        std::string port;      // defaults to 443/80
        std::string target;    // path + query, at least "/"
    };

    explicit WebSocketTransport(size_t maxQueuedMessages = 64);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void run(const Endpoint& endpoint) override;
    bool send(std::string message) override;
    void close() override;

    static std::optional<Url> parseUrl(const std::string& url);

    // Factory for StreamingSession; every run gets a fresh transport
    static TransportFactory factory(size_t maxQueuedMessages);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    size_t              maxQueued_;
    std::atomic<size_t> queued_{0};
    std::atomic<bool>   closeRequested_{false};
};
