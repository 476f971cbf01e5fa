#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/testing.h — In-process request/response harness
// ═══════════════════════════════════════════════════════════════════
//
//  testing::CaptureWriter out;
//  http::Response res(out);
//  auto req = testing::createRequest();
//  handler(req, res);
//  EXPECT_EQ(out.status, 200);
//  EXPECT_EQ(out.body, "hello");
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace lanserve::testing {

// ── Create a mock Request ──
inline http::Request createRequest(
    const std::string& method = "GET",
    const std::string& path = "/",
    const std::unordered_map<std::string, std::string>& headers = {},
    const std::string& ip = "127.0.0.1:54321") {
    http::Request req;
    req.method = method;
    req.path = path.substr(0, path.find('?'));
    req.url = path;
    req.ip = ip;
    // Lowercase all header keys
    for (auto& [k, v] : headers) {
        std::string lk = k;
        std::transform(lk.begin(), lk.end(), lk.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        req.headers[lk] = v;
    }
    return req;
}

// ═══════════════════════════════════════════
//  CaptureWriter — records what a Response put on the wire
// ═══════════════════════════════════════════
class CaptureWriter : public http::ResponseWriter {
public:
    int status = 0;
    http::Headers headers;
    std::optional<std::uint64_t> contentLength;
    std::string body;
    bool headWritten = false;
    bool finished = false;

    // Throw from writeBody once this many body bytes were accepted
    std::optional<std::size_t> failAfter;

    void writeHead(int statusCode, const http::Headers& h,
                   std::optional<std::uint64_t> length) override {
        if (headWritten) throw std::logic_error("head written twice");
        headWritten = true;
        status = statusCode;
        headers = h;
        contentLength = length;
    }

    void writeBody(const char* data, std::size_t size) override {
        if (failAfter && body.size() + size > *failAfter) {
            throw std::runtime_error("connection reset by peer");
        }
        body.append(data, size);
    }

    void finish() override {
        finished = true;
    }

    std::string header(const std::string& key) const {
        auto it = headers.find(key);
        return it != headers.end() ? it->second : "";
    }
};

} // namespace lanserve::testing
