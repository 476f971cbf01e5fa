#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/archive.h — On-the-fly directory archives (tar, tar.gz, zip)
// ═══════════════════════════════════════════════════════════════════
//
//  archive::write("/srv/photos", "photos", archive::Kind::Zip, response);
//
//  The directory is walked depth-first in lexical order, root first.
//  Every entry is named "<baseName>/<relative path>", so the archive
//  always unpacks into a single top-level directory. Nothing is
//  buffered beyond one copy buffer and nothing is written to disk.
//
//  Any error (unreadable entry, vanished file, client gone) throws and
//  leaves a truncated stream behind; there is no rollback.
//
// ═══════════════════════════════════════════════════════════════════

#include "io.h"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace lanserve::archive {

enum class Kind {
    TarGz,
    Zip,
    Tar,
};

// ── "tar.gz" | "zip" | "tar" → Kind; throws config::ConfigError ──
Kind parseKind(const std::string& name);

std::string kindName(Kind kind);

// ".tar.gz", ".zip", ".tar"
std::string suffix(Kind kind);

// application/gzip, application/zip, application/x-tar
std::string contentType(Kind kind);

// Accepted spellings, for usage text and error messages
const std::vector<std::string>& validKinds();

// ── One visited filesystem entry ──
struct Entry {
    std::filesystem::path absolute;
    std::filesystem::path relative;   // "" for the root itself
    bool          isDirectory = false;
    std::uint64_t size  = 0;
    std::uint32_t mode  = 0;
    std::int64_t  mtime = 0;
};

// ── Depth-first walk, root first, children in lexical order ──
//    Symlinks to regular files are followed; symlinked directories are
//    reported as (empty) directories and not descended into, so cycles
//    are impossible. Sockets, FIFOs, devices and dangling links are
//    skipped. Errors throw std::filesystem::filesystem_error.
void walk(const std::filesystem::path& root, const std::function<void(const Entry&)>& visit);

// ── Serialize `root` into `out` ──
//    Finalizes every layer (tar before gzip, zip central directory)
//    before returning.
void write(const std::filesystem::path& root, const std::string& baseName, Kind kind,
           io::Writer& out);

} // namespace lanserve::archive
