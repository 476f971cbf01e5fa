#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/handler.h — The single route: stream the content, count
//  the download
// ═══════════════════════════════════════════════════════════════════

#include "content.h"
#include "http.h"
#include "lifecycle.h"
#include <memory>
#include <string>
#include <utility>

namespace lanserve {

// ── Quote a filename for Content-Disposition ──
std::string contentDisposition(const std::string& filename);

class DownloadHandler {
public:
    DownloadHandler(std::shared_ptr<const content::ContentProvider> provider,
                    std::shared_ptr<lifecycle::Lifecycle> lifecycle)
        : provider_(std::move(provider)), lifecycle_(std::move(lifecycle)) {}

    // Any method, any path. Transfer errors are logged here and never
    // escape to the transport.
    void operator()(http::Request& req, http::Response& res) const;

private:
    std::shared_ptr<const content::ContentProvider> provider_;
    std::shared_ptr<lifecycle::Lifecycle> lifecycle_;
};

} // namespace lanserve
