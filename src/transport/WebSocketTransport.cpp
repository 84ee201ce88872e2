#include "transport/WebSocketTransport.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <spdlog/spdlog.h>
#include <deque>
#include <type_traits>

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
namespace ssl       = net::ssl;
using tcp           = net::ip::tcp;

namespace {

// How long a graceful close handshake may take before the socket is dropped
constexpr auto kCloseGrace = std::chrono::seconds(2);

// Everything below runs on the io_context thread only.
class Connection {
public:
    virtual ~Connection() = default;
    virtual void start() = 0;
    virtual void enqueue(std::string message) = 0;
    virtual void shutdown() = 0;
};

template <bool Tls>
class BasicConnection : public Connection,
                        public std::enable_shared_from_this<BasicConnection<Tls>> {
    using Layer  = std::conditional_t<Tls, beast::ssl_stream<beast::tcp_stream>,
                                           beast::tcp_stream>;
    using Stream = websocket::stream<Layer>;

public:
    BasicConnection(net::io_context& ioc, ssl::context& sslCtx,
                    WebSocketTransport::Url url, Endpoint endpoint,
                    IRealtimeTransport& owner, size_t maxQueued)
        : resolver_(ioc)
        , ws_(makeStream(ioc, sslCtx))
        , closeTimer_(ioc)
        , url_(std::move(url))
        , endpoint_(std::move(endpoint))
        , owner_(owner)
        , maxQueued_(maxQueued) {}

    void start() override {
        if (closing_) return;
        resolver_.async_resolve(url_.host, url_.port,
            [self = this->shared_from_this()](beast::error_code ec,
                                              tcp::resolver::results_type results) {
                self->onResolve(ec, results);
            });
    }

    void enqueue(std::string message) override {
        if (!open_ || closing_) return;
        if (outbox_.size() >= maxQueued_) {
            spdlog::debug("WebSocket: outbox full, dropping message");
            return;
        }
        outbox_.push_back(std::move(message));
        if (!writing_) doWrite();
    }

    void shutdown() override {
        if (closing_) return;
        closing_ = true;

        if (!open_) {
            // Still resolving/connecting/handshaking: abort outright
            resolver_.cancel();
            finish();
            return;
        }

        // Keep only the in-flight write; its buffer must outlive the operation
        if (writing_ && outbox_.size() > 1)
            outbox_.erase(outbox_.begin() + 1, outbox_.end());
        else if (!writing_)
            outbox_.clear();

        closeTimer_.expires_after(kCloseGrace);
        closeTimer_.async_wait([self = this->shared_from_this()](beast::error_code ec) {
            if (ec) return;
            spdlog::debug("WebSocket: close handshake timed out");
            self->finish();
        });

        if (writing_)
            closePending_ = true;
        else
            doClose();
    }

private:
    static Stream makeStream(net::io_context& ioc, ssl::context& ctx) {
        if constexpr (Tls) {
            return Stream(ioc, ctx);
        } else {
            (void)ctx;
            return Stream(ioc);
        }
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail("resolve", ec);

        auto& tcpLayer = beast::get_lowest_layer(ws_);
        tcpLayer.expires_after(endpoint_.connectTimeout);
        tcpLayer.async_connect(results,
            [self = this->shared_from_this()](beast::error_code ec,
                                              tcp::resolver::results_type::endpoint_type) {
                self->onConnect(ec);
            });
    }

    void onConnect(beast::error_code ec) {
        if (ec) return fail("connect", ec);

        if constexpr (Tls) {
            // SNI is required by most TLS front-ends
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(),
                                          url_.host.c_str())) {
                ec = beast::error_code(static_cast<int>(::ERR_get_error()),
                                       net::error::get_ssl_category());
                return fail("tls sni", ec);
            }
            ws_.next_layer().set_verify_callback(ssl::host_name_verification(url_.host));

            beast::get_lowest_layer(ws_).expires_after(endpoint_.connectTimeout);
            ws_.next_layer().async_handshake(ssl::stream_base::client,
                [self = this->shared_from_this()](beast::error_code ec) {
                    if (ec) return self->fail("tls handshake", ec);
                    self->upgrade();
                });
        } else {
            upgrade();
        }
    }

    void upgrade() {
        // The websocket layer manages its own timeouts from here on
        beast::get_lowest_layer(ws_).expires_never();

        websocket::stream_base::timeout opt{
            endpoint_.connectTimeout,         // handshake
            websocket::stream_base::none(),   // idle
            false                             // keep-alive pings
        };
        ws_.set_option(opt);

        ws_.set_option(websocket::stream_base::decorator(
            [headers = endpoint_.headers](websocket::request_type& req) {
                req.set(http::field::user_agent, "live-interpreter");
                for (auto& [name, value] : headers)
                    req.set(name, value);
            }));

        ws_.async_handshake(url_.host + ":" + url_.port, url_.target,
            [self = this->shared_from_this()](beast::error_code ec) {
                self->onHandshake(ec);
            });
    }

    void onHandshake(beast::error_code ec) {
        if (ec) return fail("websocket handshake", ec);

        ws_.text(true);
        open_ = true;
        spdlog::debug("WebSocket: connected to {}", url_.host);

        if (owner_.onOpen) owner_.onOpen();
        doRead();
    }

    void doRead() {
        ws_.async_read(buffer_,
            [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                self->onRead(ec);
            });
    }

    void onRead(beast::error_code ec) {
        if (ec == websocket::error::closed) {
            if (!closing_ && owner_.onError) {
                owner_.onError("connection closed by server (code " +
                               std::to_string(ws_.reason().code) + ")");
            }
            return finish();
        }
        if (ec) return fail("read", ec);

        std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        if (!closing_ && owner_.onMessage)
            owner_.onMessage(message);
        doRead();
    }

    void doWrite() {
        writing_ = true;
        ws_.async_write(net::buffer(outbox_.front()),
            [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                self->onWrite(ec);
            });
    }

    void onWrite(beast::error_code ec) {
        writing_ = false;
        if (ec) return fail("write", ec);

        if (!outbox_.empty()) outbox_.pop_front();

        if (closing_) {
            if (closePending_) doClose();
            return;
        }
        if (!outbox_.empty()) doWrite();
    }

    void doClose() {
        closePending_ = false;
        ws_.async_close(websocket::close_code::normal,
            [self = this->shared_from_this()](beast::error_code ec) {
                if (ec) spdlog::debug("WebSocket: close: {}", ec.message());
                self->finish();
            });
    }

    void fail(const char* what, beast::error_code ec) {
        if (!closing_ && !failed_) {
            failed_ = true;
            if (owner_.onError)
                owner_.onError(std::string(what) + ": " + ec.message());
        }
        finish();
    }

    // Drops the socket; pending operations complete with errors and the
    // io_context runs out of work.
    void finish() {
        open_ = false;
        closeTimer_.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
    }

    tcp::resolver         resolver_;
    Stream                ws_;
    net::steady_timer     closeTimer_;
    beast::flat_buffer    buffer_;
    std::deque<std::string> outbox_;

    WebSocketTransport::Url url_;
    Endpoint            endpoint_;
    IRealtimeTransport& owner_;
    size_t              maxQueued_;

    bool open_         = false;
    bool writing_      = false;
    bool closing_      = false;
    bool closePending_ = false;
    bool failed_       = false;
};

} // namespace

struct WebSocketTransport::Impl {
    net::io_context             ioc;
    ssl::context                sslCtx{ssl::context::tls_client};
    std::shared_ptr<Connection> conn;
};

WebSocketTransport::WebSocketTransport(size_t maxQueuedMessages)
    : impl_(std::make_unique<Impl>())
    , maxQueued_(maxQueuedMessages > 0 ? maxQueuedMessages : 1) {}

WebSocketTransport::~WebSocketTransport() {
    close();
}

TransportFactory WebSocketTransport::factory(size_t maxQueuedMessages) {
    return [maxQueuedMessages]() -> std::unique_ptr<IRealtimeTransport> {
        return std::make_unique<WebSocketTransport>(maxQueuedMessages);
    };
}

std::optional<WebSocketTransport::Url> WebSocketTransport::parseUrl(const std::string& url) {
    Url out;
    std::string rest;
    if (url.rfind("wss://", 0) == 0) {
        out.secure = true;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        out.secure = false;
        rest = url.substr(5);
    } else {
        return std::nullopt;
    }

    auto slash = rest.find_first_of("/?");
    std::string authority = rest.substr(0, slash);
    out.target = slash == std::string::npos ? "/" : rest.substr(slash);
    if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
        if (out.port.empty() ||
            out.port.find_first_not_of("0123456789") != std::string::npos)
            return std::nullopt;
    } else {
        out.host = authority;
        out.port = out.secure ? "443" : "80";
    }

    if (out.host.empty()) return std::nullopt;
    return out;
}

void WebSocketTransport::run(const Endpoint& endpoint) {
    auto url = parseUrl(endpoint.url);
    if (!url) {
        if (onError) onError("invalid websocket url: " + endpoint.url);
        return;
    }
    if (closeRequested_) return;

    if (url->secure) {
        try {
            impl_->sslCtx.set_default_verify_paths();
            impl_->sslCtx.set_verify_mode(ssl::verify_peer);
        } catch (const boost::system::system_error& e) {
            if (onError) onError(std::string("tls setup: ") + e.what());
            return;
        }
        impl_->conn = std::make_shared<BasicConnection<true>>(
            impl_->ioc, impl_->sslCtx, *url, endpoint, *this, maxQueued_);
    } else {
        impl_->conn = std::make_shared<BasicConnection<false>>(
            impl_->ioc, impl_->sslCtx, *url, endpoint, *this, maxQueued_);
    }

    net::post(impl_->ioc, [conn = impl_->conn] { conn->start(); });
    impl_->ioc.run();
    impl_->conn.reset();
}

bool WebSocketTransport::send(std::string message) {
    if (closeRequested_) return false;
    if (queued_.load() >= maxQueued_) return false;

    queued_++;
    net::post(impl_->ioc, [this, m = std::move(message)]() mutable {
        queued_--;
        if (impl_->conn) impl_->conn->enqueue(std::move(m));
    });
    return true;
}

void WebSocketTransport::close() {
    if (closeRequested_.exchange(true)) return;
    net::post(impl_->ioc, [this] {
        if (impl_->conn) impl_->conn->shutdown();
    });
}
