#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/http.h — Streaming HTTP server, Request, and Response
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    http::Server server([](http::Request& req, http::Response& res) {
//        res.type("text/plain").length(5);
//        res.write("hello");
//        res.end();
//    });
//    server.listen("0.0.0.0", 8080);
//    server.start();
//    ...
//    server.close();
//
//  Every accepted connection is served on its own thread, so a handler
//  may block on disk and network I/O for as long as a transfer takes.
//
// ═══════════════════════════════════════════════════════════════════

#include "io.h"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace lanserve::http {

// ── Forward declarations ──
class Request;
class Response;
class Server;

// ── Type aliases ──
using Headers       = std::unordered_map<std::string, std::string>;
using RouteHandler  = std::function<void(Request&, Response&)>;
using ErrorCallback = std::function<void(const std::string&)>;

// ═══════════════════════════════════════════════════════════════════
//  class Request
//  Represents an incoming HTTP request. Bodies are ignored.
// ═══════════════════════════════════════════════════════════════════
class Request {
public:
    std::string method;
    std::string url;            // Full request target
    std::string path;           // Target without query string
    std::string ip;             // Remote endpoint, "addr:port"
    unsigned    version = 11;   // 10 or 11

    // All headers (lowercase keys)
    Headers headers;

    // ── Get a header value (case-insensitive) ──
    std::string header(const std::string& name) const {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = headers.find(lower);
        return it != headers.end() ? it->second : "";
    }
};

// ═══════════════════════════════════════════════════════════════════
//  class ResponseWriter
//  Transport seam under Response: the Beast session implements it
//  for real sockets, testing::CaptureWriter for in-process tests.
//  Every method throws on transport failure.
// ═══════════════════════════════════════════════════════════════════
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    // contentLength == nullopt selects a framing that needs no length
    virtual void writeHead(int statusCode, const Headers& headers,
                           std::optional<std::uint64_t> contentLength) = 0;
    virtual void writeBody(const char* data, std::size_t size) = 0;
    virtual void finish() = 0;
};

// ═══════════════════════════════════════════════════════════════════
//  class Response
//  Status and headers are buffered until the first body byte (or
//  end()), then written once; after that only body bytes follow.
// ═══════════════════════════════════════════════════════════════════
class Response : public io::Writer {
public:
    using io::Writer::write;

    explicit Response(ResponseWriter& writer) : writer_(writer) {}

    // ── Set status code (chainable) ──
    Response& status(int code) {
        statusCode_ = code;
        return *this;
    }

    // ── Set a response header (chainable) ──
    Response& set(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    // ── Remove a previously set header (chainable) ──
    Response& unset(const std::string& key) {
        headers_.erase(key);
        return *this;
    }

    // ── Set Content-Type (chainable) ──
    Response& type(const std::string& contentType) {
        return set("Content-Type", contentType);
    }

    // ── Declare the body length; nullopt means "unknown" (chainable) ──
    Response& length(std::optional<std::uint64_t> contentLength) {
        contentLength_ = contentLength;
        return *this;
    }

    // ── Stream body bytes; the first call sends the headers ──
    //    With a declared length, a write that would pass it throws and
    //    nothing of it is sent.
    void write(const char* data, std::size_t size) override {
        if (finished_) throw std::logic_error("write after response end");
        if (contentLength_ && size > *contentLength_ - bytesWritten_) {
            throw std::runtime_error("wrote more than the declared Content-Length of " +
                                     std::to_string(*contentLength_) + " bytes");
        }
        flushHead();
        if (size == 0) return;
        writer_.writeBody(data, size);
        bytesWritten_ += size;
    }

    // ── Complete the response ──
    //    Throws, leaving the response unfinished, when fewer bytes than
    //    the declared length were written.
    void end() {
        if (finished_) return;
        if (contentLength_ && bytesWritten_ < *contentLength_) {
            throw std::runtime_error("body ended after " + std::to_string(bytesWritten_) +
                                     " of " + std::to_string(*contentLength_) + " declared bytes");
        }
        flushHead();
        writer_.finish();
        finished_ = true;
    }

    // ── Send a whole body at once ──
    void send(const std::string& body) {
        if (headersSent_) return;
        if (headers_.find("Content-Type") == headers_.end()) {
            headers_["Content-Type"] = "text/plain; charset=utf-8";
        }
        length(body.size());
        write(body);
        end();
    }

    // ── Send with status code shorthand ──
    void sendStatus(int code, const std::string& message) {
        status(code);
        send(message);
    }

    bool headersSent() const { return headersSent_; }
    bool finished() const { return finished_; }
    std::uint64_t bytesWritten() const { return bytesWritten_; }
    int getStatusCode() const { return statusCode_; }
    const Headers& getHeaders() const { return headers_; }
    std::optional<std::uint64_t> getLength() const { return contentLength_; }

private:
    void flushHead() {
        if (headersSent_) return;
        headersSent_ = true;
        writer_.writeHead(statusCode_, headers_, contentLength_);
    }

    ResponseWriter& writer_;
    int statusCode_ = 200;
    Headers headers_;
    std::optional<std::uint64_t> contentLength_;
    bool headersSent_ = false;
    bool finished_ = false;
    std::uint64_t bytesWritten_ = 0;
};

// ═══════════════════════════════════════════════════════════════════
//  class Server
//  Single-handler HTTP/1.1 server. Uses pimpl to hide Boost.Beast
//  implementation details.
// ═══════════════════════════════════════════════════════════════════
class Server {
public:
    explicit Server(RouteHandler handler);
    ~Server();

    // Non-copyable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ── Bind and listen; throws std::runtime_error on failure ──
    //    Port 0 picks an ephemeral port, see port().
    void listen(const std::string& host, int port);

    // ── Accept connections on a background thread ──
    //    onError is called once if accepting fails for good.
    void start(ErrorCallback onError = nullptr);

    // ── Stop accepting new connections ──
    //    Idle keep-alive connections are closed. A request in progress
    //    finishes, then its connection closes. Idempotent.
    void close();

    bool listening() const;
    unsigned short port() const;

    // ── Process a request (used internally and for testing) ──
    void handleRequest(Request& req, Response& res);

private:
    friend class HttpListener;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lanserve::http
