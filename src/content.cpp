// ═══════════════════════════════════════════════════════════════════
//  src/content.cpp — File and archive content providers
// ═══════════════════════════════════════════════════════════════════

#include "lanserve/content.h"

#include "lanserve/config.h"
#include "lanserve/mime.h"
#include "lanserve/path.h"

#include <fstream>
#include <system_error>

namespace lanserve::content {

namespace fs = std::filesystem;

ContentSpec ContentSpec::fromPath(const std::string& target, archive::Kind kind) {
    std::error_code ec;
    auto status = fs::status(target, ec);
    if (ec || !fs::exists(status)) {
        if (!ec || ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
            throw config::ConfigError("file not found: " + target);
        }
        throw config::ConfigError("cannot access file: " + target + ": " + ec.message());
    }

    ContentSpec spec;
    spec.path = fs::path(target);
    spec.displayName = path::basename(target);
    spec.archiveKind = kind;

    if (fs::is_directory(status)) {
        spec.type = Type::Directory;
        return spec;
    }

    if (!fs::is_regular_file(status)) {
        throw config::ConfigError("cannot access file: " + target + ": not a regular file or directory");
    }

    spec.type = Type::File;
    spec.size = fs::file_size(spec.path, ec);
    if (ec) {
        throw config::ConfigError("cannot access file: " + target + ": " + ec.message());
    }
    return spec;
}

// ── FileProvider ──

std::string FileProvider::filename() const {
    return spec_.displayName;
}

std::string FileProvider::contentType() const {
    return mime::lookup(spec_.displayName);
}

std::optional<std::uint64_t> FileProvider::contentLength() const {
    return spec_.size;
}

void FileProvider::writeTo(io::Writer& out) const {
    std::ifstream file(spec_.path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + spec_.path.string());
    }
    io::copy(file, out, spec_.path.string());
}

// ── ArchiveProvider ──

std::string ArchiveProvider::filename() const {
    return spec_.displayName + archive::suffix(spec_.archiveKind);
}

std::string ArchiveProvider::contentType() const {
    return archive::contentType(spec_.archiveKind);
}

void ArchiveProvider::writeTo(io::Writer& out) const {
    archive::write(spec_.path, spec_.displayName, spec_.archiveKind, out);
}

std::unique_ptr<ContentProvider> makeProvider(const ContentSpec& spec) {
    if (spec.isDirectory()) {
        return std::make_unique<ArchiveProvider>(spec);
    }
    return std::make_unique<FileProvider>(spec);
}

} // namespace lanserve::content
