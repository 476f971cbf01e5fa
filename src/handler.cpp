// ═══════════════════════════════════════════════════════════════════
//  src/handler.cpp — Download request handling
// ═══════════════════════════════════════════════════════════════════

#include "lanserve/handler.h"

#include "lanserve/console.h"

#include <exception>

namespace lanserve {

std::string contentDisposition(const std::string& filename) {
    std::string quoted;
    quoted.reserve(filename.size());
    for (char c : filename) {
        if (c == '"' || c == '\\') quoted += '\\';
        quoted += c;
    }
    return "attachment; filename=\"" + quoted + "\"";
}

void DownloadHandler::operator()(http::Request& req, http::Response& res) const {
    auto transfer = lifecycle_->active.track();
    console::info("Download started from", req.ip);

    res.type(provider_->contentType())
       .set("Content-Disposition", contentDisposition(provider_->filename()))
       .length(provider_->contentLength());

    try {
        provider_->writeTo(res);
        res.end();
    } catch (const std::exception& e) {
        auto sent = res.bytesWritten();
        if (!res.headersSent()) {
            res.unset("Content-Disposition").unset("Content-Type").length(std::nullopt);
            try {
                res.sendStatus(500, "Internal Server Error");
            } catch (const std::exception& inner) {
                console::debug("Could not send error response to", req.ip, ":", inner.what());
            }
        }
        console::warn("Download to", req.ip, "interrupted after", sent,
                      "bytes:", e.what());
        return;
    }

    auto completion = lifecycle_->limit.recordCompletion();
    console::success("Download completed to", req.ip, "(" + std::to_string(res.bytesWritten()),
                     "bytes)");
    if (completion.remaining && *completion.remaining > 0) {
        console::info(*completion.remaining, "download(s) remaining");
    }
}

} // namespace lanserve
