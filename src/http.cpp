// ═══════════════════════════════════════════════════════════════════
//  src/http.cpp — Boost.Beast-powered HTTP server implementation
// ═══════════════════════════════════════════════════════════════════

#include "lanserve/http.h"

#include "lanserve/console.h"

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>

namespace lanserve::http {

namespace beast  = boost::beast;
namespace net    = boost::asio;
namespace bhttp  = beast::http;
using tcp        = net::ip::tcp;

namespace {

constexpr const char* ServerName = "lanserve";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string describeEndpoint(const tcp::socket& socket) {
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) return "unknown";
    std::ostringstream oss;
    oss << endpoint;
    return oss.str();
}

// Accept failures worth retrying after a pause instead of giving up
bool isTemporary(const beast::error_code& ec) {
    return ec == net::error::connection_aborted ||
           ec == net::error::no_descriptors ||
           ec == net::error::no_buffer_space ||
           ec == net::error::no_memory ||
           ec == net::error::try_again ||
           ec == net::error::interrupted;
}

} // namespace

// ═══════════════════════════════════════════
//  ConnectionRegistry — live connections, so close() can end them
// ═══════════════════════════════════════════
//  A connection is idle while it waits for its next request. close()
//  shuts idle sockets down, which wakes their blocking read; busy ones
//  finish the current response with "Connection: close" and exit.
class ConnectionRegistry {
public:
    // Returns false once closing; the caller must not read again
    bool markIdle(tcp::socket& socket) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) return false;
        idle_.insert(&socket);
        return true;
    }

    // Also called before the socket is closed, so close() never
    // touches a dead socket
    void markBusy(tcp::socket& socket) {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.erase(&socket);
    }

    bool closing() const { return closing_; }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
        for (auto* socket : idle_) {
            beast::error_code ec;
            socket->shutdown(tcp::socket::shutdown_both, ec);
        }
        idle_.clear();
    }

private:
    std::mutex mutex_;
    std::atomic<bool> closing_{false};
    std::set<tcp::socket*> idle_;
};

// ═══════════════════════════════════════════
//  BeastResponseWriter — frames a Response onto a socket
// ═══════════════════════════════════════════
class BeastResponseWriter : public ResponseWriter {
public:
    BeastResponseWriter(tcp::socket& socket, unsigned version, bool keepAlive, bool headOnly,
                        const ConnectionRegistry& registry)
        : socket_(socket), version_(version), keepAlive_(keepAlive), headOnly_(headOnly)
        , registry_(registry) {}

    void writeHead(int statusCode, const Headers& headers,
                   std::optional<std::uint64_t> contentLength) override {
        if (registry_.closing()) keepAlive_ = false;
        bhttp::response<bhttp::empty_body> head{static_cast<bhttp::status>(statusCode), version_};
        head.set(bhttp::field::server, ServerName);
        for (const auto& [key, value] : headers) {
            if (!value.empty()) head.set(key, value);
        }

        if (contentLength) {
            head.content_length(*contentLength);
        } else if (version_ >= 11) {
            chunked_ = true;
            head.chunked(true);
        } else {
            // HTTP/1.0 without a length: the body ends when we close
            keepAlive_ = false;
        }
        head.keep_alive(keepAlive_);

        bhttp::response_serializer<bhttp::empty_body> sr{head};
        bhttp::write_header(socket_, sr);
    }

    void writeBody(const char* data, std::size_t size) override {
        if (headOnly_ || size == 0) return;
        if (chunked_) {
            net::write(socket_, bhttp::make_chunk(net::const_buffer(data, size)));
        } else {
            net::write(socket_, net::const_buffer(data, size));
        }
    }

    void finish() override {
        if (chunked_ && !headOnly_) {
            net::write(socket_, bhttp::make_chunk_last());
        }
    }

    bool keepAlive() const { return keepAlive_; }

private:
    tcp::socket& socket_;
    unsigned version_;
    bool keepAlive_;
    bool headOnly_;
    const ConnectionRegistry& registry_;
    bool chunked_ = false;
};

// ═══════════════════════════════════════════
//  Session — serves one connection on its own thread
// ═══════════════════════════════════════════
class HttpSession {
public:
    HttpSession(tcp::socket socket, std::shared_ptr<const RouteHandler> handler,
                std::shared_ptr<ConnectionRegistry> registry,
                std::shared_ptr<net::io_context> ioc)
        : socket_(std::move(socket))
        , handler_(std::move(handler))
        , registry_(std::move(registry))
        , ioc_(std::move(ioc))
    {}

    void run() {
        beast::error_code ec;
        while (registry_->markIdle(socket_)) {
            bhttp::request<bhttp::string_body> beastRequest;
            bhttp::read(socket_, buffer_, beastRequest, ec);
            registry_->markBusy(socket_);
            if (ec == bhttp::error::end_of_stream) break;
            if (ec) {
                console::debug("Read error from", describeEndpoint(socket_), ":", ec.message());
                break;
            }
            // Arrived as the server closed
            if (registry_->closing()) break;
            if (!serve(beastRequest)) break;
        }
        registry_->markBusy(socket_);
        socket_.shutdown(tcp::socket::shutdown_send, ec);
        socket_.close(ec);
    }

private:
    tcp::socket socket_;
    beast::flat_buffer buffer_;
    std::shared_ptr<const RouteHandler> handler_;
    std::shared_ptr<ConnectionRegistry> registry_;
    std::shared_ptr<net::io_context> ioc_;   // outlives socket_

    // Returns whether the connection may carry another request
    bool serve(const bhttp::request<bhttp::string_body>& beastRequest) {
        // ── Build lanserve::Request from Beast request ──
        Request req;
        req.method  = std::string(beastRequest.method_string());
        req.url     = std::string(beastRequest.target());
        req.path    = req.url.substr(0, req.url.find('?'));
        req.ip      = describeEndpoint(socket_);
        req.version = beastRequest.version();
        for (const auto& field : beastRequest) {
            req.headers[toLower(std::string(field.name_string()))] = std::string(field.value());
        }

        BeastResponseWriter writer(socket_, beastRequest.version(), beastRequest.keep_alive(),
                                   beastRequest.method() == bhttp::verb::head, *registry_);
        Response res(writer);

        try {
            (*handler_)(req, res);
            if (!res.headersSent()) {
                res.sendStatus(404, "Not Found");
            }
        } catch (const std::exception& e) {
            console::error("Unhandled error serving", req.ip, ":", e.what());
            if (!res.headersSent()) {
                try {
                    res.sendStatus(500, "Internal Server Error");
                } catch (const std::exception& inner) {
                    console::debug("Could not send error response to", req.ip, ":", inner.what());
                }
            }
            return false;
        }

        return res.finished() && writer.keepAlive() && !registry_->closing();
    }
};

// ═══════════════════════════════════════════
//  Server::Impl — Hidden implementation
// ═══════════════════════════════════════════
struct Server::Impl {
    explicit Impl(RouteHandler h)
        : handler(std::make_shared<const RouteHandler>(std::move(h)))
        , connections(std::make_shared<ConnectionRegistry>())
        , ioc(std::make_shared<net::io_context>(1))
        , acceptor(net::make_strand(*ioc))
        , retryTimer(acceptor.get_executor())
    {}

    std::shared_ptr<const RouteHandler> handler;
    std::shared_ptr<ConnectionRegistry> connections;
    std::shared_ptr<net::io_context>    ioc;
    tcp::acceptor                       acceptor;
    net::steady_timer                   retryTimer;
    std::thread                         acceptThread;
    ErrorCallback                       onError;
    unsigned short                      boundPort = 0;
    std::atomic<bool>                   running{false};
    std::mutex                          lifecycleMutex;
    bool                                closed = false;
};

// ═══════════════════════════════════════════
//  Listener — Accepts incoming TCP connections
// ═══════════════════════════════════════════
class HttpListener {
public:
    explicit HttpListener(Server::Impl& server) : server_(server) {}

    void doAccept() {
        server_.acceptor.async_accept(
            [this](beast::error_code ec, tcp::socket socket) { onAccept(ec, std::move(socket)); });
    }

private:
    Server::Impl& server_;
    std::chrono::milliseconds backoff_{0};

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted || !server_.acceptor.is_open()) {
            return;
        }

        if (ec) {
            if (isTemporary(ec)) {
                backoff_ = backoff_.count() == 0
                    ? std::chrono::milliseconds(5)
                    : std::min(backoff_ * 2, std::chrono::milliseconds(1000));
                console::warn("Accept error:", ec.message(), "- retrying in",
                              std::to_string(backoff_.count()) + "ms");
                server_.retryTimer.expires_after(backoff_);
                server_.retryTimer.async_wait([this](beast::error_code timerEc) {
                    if (!timerEc) doAccept();
                });
                return;
            }
            console::debug("Accept failed permanently:", ec.message());
            if (server_.onError) server_.onError(ec.message());
            return;
        }
        backoff_ = std::chrono::milliseconds(0);

        auto handler = server_.handler;
        auto connections = server_.connections;
        auto ioc = server_.ioc;
        std::thread([socket = std::move(socket), handler, connections, ioc]() mutable {
            HttpSession(std::move(socket), handler, connections, ioc).run();
        }).detach();

        doAccept();
    }
};

// ═══════════════════════════════════════════
//  Server — Public API implementation
// ═══════════════════════════════════════════

Server::Server(RouteHandler handler)
    : impl_(std::make_unique<Impl>(std::move(handler)))
{}

Server::~Server() {
    close();
}

void Server::listen(const std::string& host, int port) {
    beast::error_code ec;
    auto address = net::ip::make_address(host, ec);
    if (ec) throw std::runtime_error("invalid bind address \"" + host + "\": " + ec.message());

    auto endpoint = tcp::endpoint(address, static_cast<unsigned short>(port));
    auto where = host + ":" + std::to_string(port);
    auto& acceptor = impl_->acceptor;

    acceptor.open(endpoint.protocol(), ec);
    if (ec) throw std::runtime_error("cannot open acceptor for " + where + ": " + ec.message());

    acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw std::runtime_error("cannot set reuse_address: " + ec.message());

    acceptor.bind(endpoint, ec);
    if (ec) throw std::runtime_error("cannot bind to " + where + ": " + ec.message());

    acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw std::runtime_error("cannot listen on " + where + ": " + ec.message());

    impl_->boundPort = acceptor.local_endpoint().port();
}

void Server::start(ErrorCallback onError) {
    std::lock_guard<std::mutex> lock(impl_->lifecycleMutex);
    if (!impl_->acceptor.is_open()) {
        throw std::logic_error("Server::start() called before listen()");
    }
    if (impl_->running || impl_->closed) return;

    impl_->onError = std::move(onError);
    impl_->running = true;
    impl_->acceptThread = std::thread([impl = impl_.get()] {
        HttpListener listener(*impl);
        listener.doAccept();
        impl->ioc->run();
    });
}

void Server::close() {
    std::lock_guard<std::mutex> lock(impl_->lifecycleMutex);
    if (impl_->closed) return;
    impl_->closed = true;

    impl_->connections->close();

    // Also right when run() already returned after a failed accept.
    // Once the thread is joined the acceptor is ours to close.
    if (impl_->running) {
        impl_->ioc->stop();
        if (impl_->acceptThread.joinable()) impl_->acceptThread.join();
        impl_->running = false;
    }
    beast::error_code ec;
    impl_->retryTimer.cancel();
    impl_->acceptor.close(ec);
}

bool Server::listening() const {
    return impl_->running && !impl_->closed;
}

unsigned short Server::port() const {
    return impl_->boundPort;
}

void Server::handleRequest(Request& req, Response& res) {
    (*impl_->handler)(req, res);
}

} // namespace lanserve::http
