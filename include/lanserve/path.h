#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/path.h — Path helpers for display names, archive entries
//  and download URLs
// ═══════════════════════════════════════════════════════════════════

#include <filesystem>
#include <string>

namespace lanserve::path {

// ── path::basename ── Last component, ignoring trailing separators.
//    "." and ".." resolve to the name of the directory they denote, so
//    serving the current directory still yields a meaningful name.
inline std::string basename(const std::string& p) {
    namespace fs = std::filesystem;
    fs::path fp(p);
    while (!fp.empty() && !fp.has_filename() && fp.has_relative_path()) {
        fp = fp.parent_path();
    }
    auto name = fp.filename().string();
    if (name.empty() || name == "." || name == "..") {
        std::error_code ec;
        auto canonical = fs::weakly_canonical(fs::absolute(p, ec), ec);
        if (!ec && canonical.has_filename()) {
            return canonical.filename().string();
        }
        return name.empty() ? p : name;
    }
    return name;
}

// ── path::entryName ── "<base>/<relative>" with '/' separators.
//    An empty or "." relative path names the root entry itself.
inline std::string entryName(const std::string& base, const std::filesystem::path& relative) {
    auto rel = relative.generic_string();
    if (rel.empty() || rel == ".") return base;
    return base + "/" + rel;
}

// ── path::encodeURIComponent ── Percent-encode everything but the
//    RFC 3986 unreserved set
inline std::string encodeURIComponent(const std::string& s) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                          c == '.' || c == '~';
        if (unreserved) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0f];
        }
    }
    return out;
}

} // namespace lanserve::path
