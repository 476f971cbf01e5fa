#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/mime.h — Content-Type lookup by file extension
// ═══════════════════════════════════════════════════════════════════

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace lanserve::mime {

inline constexpr const char* DefaultType = "application/octet-stream";

namespace detail {

inline const std::unordered_map<std::string, std::string>& table() {
    static const std::unordered_map<std::string, std::string> types = {
        {".html","text/html; charset=utf-8"}, {".htm","text/html; charset=utf-8"},
        {".css","text/css; charset=utf-8"}, {".js","text/javascript; charset=utf-8"},
        {".mjs","text/javascript; charset=utf-8"},
        {".json","application/json"}, {".xml","text/xml; charset=utf-8"},
        {".txt","text/plain; charset=utf-8"}, {".csv","text/csv; charset=utf-8"},
        {".md","text/markdown; charset=utf-8"},
        {".png","image/png"}, {".jpg","image/jpeg"}, {".jpeg","image/jpeg"},
        {".gif","image/gif"}, {".svg","image/svg+xml"}, {".ico","image/x-icon"},
        {".webp","image/webp"}, {".bmp","image/bmp"}, {".avif","image/avif"},
        {".mp3","audio/mpeg"}, {".wav","audio/wav"}, {".ogg","audio/ogg"},
        {".flac","audio/flac"}, {".m4a","audio/mp4"},
        {".mp4","video/mp4"}, {".webm","video/webm"}, {".avi","video/x-msvideo"},
        {".mkv","video/x-matroska"}, {".mov","video/quicktime"},
        {".pdf","application/pdf"}, {".zip","application/zip"},
        {".gz","application/gzip"}, {".tgz","application/gzip"},
        {".tar","application/x-tar"}, {".bz2","application/x-bzip2"},
        {".xz","application/x-xz"}, {".7z","application/x-7z-compressed"},
        {".wasm","application/wasm"},
        {".woff","font/woff"}, {".woff2","font/woff2"}, {".ttf","font/ttf"},
        {".otf","font/otf"},
    };
    return types;
}

} // namespace detail

// ── Look up the Content-Type for a file name ──
//    Extensions are matched case-insensitively; anything unknown (or no
//    extension at all) maps to application/octet-stream.
inline std::string lookup(const std::string& filename) {
    auto ext = std::filesystem::path(filename).extension().string();
    if (ext.empty()) return DefaultType;

    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = detail::table().find(ext);
    return it != detail::table().end() ? it->second : DefaultType;
}

} // namespace lanserve::mime
