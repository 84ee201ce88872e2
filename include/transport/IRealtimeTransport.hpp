#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

struct Endpoint {
    std::string url;   // ws:// or wss://
    std::vector<std::pair<std::string, std::string>> headers;
    std::chrono::milliseconds connectTimeout{10000};
};

// Persistent duplex text-message connection to the remote service.
// Implementations: WebSocketTransport (Boost.Beast).
//
// run() is called once, on the session's network thread, and blocks there:
// it connects, fires onOpen, then delivers every inbound message through
// onMessage until the connection closes or fails. The connection handle is
// only ever touched by that thread; send() and close() hand work over to it.
class IRealtimeTransport {
public:
    virtual ~IRealtimeTransport() = default;

    virtual void run(const Endpoint& endpoint) = 0;

    // Thread-safe. Returns false when the message was dropped (not open,
    // closing, or the outbound queue is full).
    virtual bool send(std::string message) = 0;

    // Thread-safe, idempotent, callable before run(). run() returns soon after.
    // May throw std::exception when the shutdown cannot be handed over; the
    // transport still counts as closing.
    virtual void close() = 0;

    // Callbacks, all invoked on the thread inside run()
    std::function<void()> onOpen;
    std::function<void(const std::string&)> onMessage;
    std::function<void(const std::string& reason)> onError;
};

using TransportFactory = std::function<std::unique_ptr<IRealtimeTransport>()>;
