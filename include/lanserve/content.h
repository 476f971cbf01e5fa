#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/content.h — What gets served: one file, or one directory
//  streamed as an archive
// ═══════════════════════════════════════════════════════════════════
//
//  auto spec = content::ContentSpec::fromPath(options.target, options.archiveKind);
//  auto provider = content::makeProvider(spec);
//  res.type(provider->contentType()).length(provider->contentLength());
//  provider->writeTo(res);
//
// ═══════════════════════════════════════════════════════════════════

#include "archive.h"
#include "io.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace lanserve::content {

// ═══════════════════════════════════════════
//  ContentSpec — validated once at startup
// ═══════════════════════════════════════════
struct ContentSpec {
    enum class Type { File, Directory };

    Type type = Type::File;
    std::filesystem::path path;
    std::string displayName;                       // base name of path
    std::uint64_t size = 0;                        // files only
    archive::Kind archiveKind = archive::Kind::TarGz;  // directories only

    bool isDirectory() const { return type == Type::Directory; }

    // Throws config::ConfigError when the path is missing or unreadable
    static ContentSpec fromPath(const std::string& target, archive::Kind kind);
};

// ═══════════════════════════════════════════
//  ContentProvider — abstract source of one download
// ═══════════════════════════════════════════
class ContentProvider {
public:
    virtual ~ContentProvider() = default;

    // Name offered to the client in Content-Disposition
    virtual std::string filename() const = 0;
    virtual std::string contentType() const = 0;

    // nullopt when the length is not known up front
    virtual std::optional<std::uint64_t> contentLength() const = 0;

    // Stream the full body; throws on any read or write failure
    virtual void writeTo(io::Writer& out) const = 0;
};

// ── Serves a regular file as-is ──
class FileProvider : public ContentProvider {
public:
    explicit FileProvider(ContentSpec spec) : spec_(std::move(spec)) {}

    std::string filename() const override;
    std::string contentType() const override;
    std::optional<std::uint64_t> contentLength() const override;
    void writeTo(io::Writer& out) const override;

private:
    ContentSpec spec_;
};

// ── Serves a directory as a freshly generated archive ──
class ArchiveProvider : public ContentProvider {
public:
    explicit ArchiveProvider(ContentSpec spec) : spec_(std::move(spec)) {}

    std::string filename() const override;
    std::string contentType() const override;
    std::optional<std::uint64_t> contentLength() const override { return std::nullopt; }
    void writeTo(io::Writer& out) const override;

private:
    ContentSpec spec_;
};

std::unique_ptr<ContentProvider> makeProvider(const ContentSpec& spec);

} // namespace lanserve::content
