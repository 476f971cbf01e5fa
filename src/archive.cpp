// ═══════════════════════════════════════════════════════════════════
//  src/archive.cpp — Directory walk and per-format entry encoding
// ═══════════════════════════════════════════════════════════════════

#include "lanserve/archive.h"

#include "lanserve/compress.h"
#include "lanserve/config.h"
#include "lanserve/path.h"
#include "lanserve/tar.h"
#include "lanserve/zip.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace lanserve::archive {

namespace fs = std::filesystem;

namespace {

std::int64_t toUnixSeconds(fs::file_time_type mtime) {
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        mtime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::seconds>(sctp.time_since_epoch()).count();
}

Entry describe(const fs::path& absolute, const fs::path& relative) {
    Entry entry;
    entry.absolute = absolute;
    entry.relative = relative;

    auto link = fs::symlink_status(absolute);
    auto target = fs::is_symlink(link) ? fs::status(absolute) : link;

    entry.isDirectory = fs::is_directory(target);
    entry.mode = static_cast<std::uint32_t>(target.permissions()) & 07777;
    entry.mtime = toUnixSeconds(fs::last_write_time(absolute));
    if (fs::is_regular_file(target)) {
        entry.size = fs::file_size(absolute);
    }
    return entry;
}

void walkDirectory(const fs::path& dir, const fs::path& relative,
                   const std::function<void(const Entry&)>& visit) {
    std::vector<fs::path> children;
    for (const auto& child : fs::directory_iterator(dir)) {
        children.push_back(child.path());
    }
    std::sort(children.begin(), children.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().native() < b.filename().native();
    });

    for (const auto& child : children) {
        auto link = fs::symlink_status(child);
        auto target = fs::is_symlink(link) ? fs::status(child) : link;
        if (!fs::is_directory(target) && !fs::is_regular_file(target)) {
            continue;
        }

        auto childRelative = relative / child.filename();
        auto entry = describe(child, childRelative);
        visit(entry);

        if (entry.isDirectory && !fs::is_symlink(link)) {
            walkDirectory(child, childRelative, visit);
        }
    }
}

void copyFile(const Entry& entry, io::Writer& out) {
    std::ifstream file(entry.absolute, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open '" + entry.absolute.string() + "'");
    }
    io::copy(file, out, entry.absolute.string());
}

void writeTar(const fs::path& root, const std::string& baseName, io::Writer& out) {
    tar::Writer tw(out);
    walk(root, [&](const Entry& entry) {
        tar::Header header;
        header.name  = path::entryName(baseName, entry.relative);
        header.type  = entry.isDirectory ? tar::EntryType::Directory : tar::EntryType::File;
        header.size  = entry.isDirectory ? 0 : entry.size;
        header.mode  = entry.mode;
        header.mtime = entry.mtime;
        tw.writeHeader(header);
        if (!entry.isDirectory) {
            copyFile(entry, tw);
        }
    });
    tw.close();
}

void writeZip(const fs::path& root, const std::string& baseName, io::Writer& out) {
    zip::Writer zw(out);
    walk(root, [&](const Entry& entry) {
        zip::EntryHeader header;
        header.name   = path::entryName(baseName, entry.relative);
        header.method = zip::Method::Deflate;
        header.mode   = entry.mode;
        header.mtime  = entry.mtime;
        if (entry.isDirectory) {
            header.name += "/";
            header.method = zip::Method::Store;
        }
        zw.createEntry(header);
        if (!entry.isDirectory) {
            copyFile(entry, zw);
        }
    });
    zw.close();
}

} // namespace

Kind parseKind(const std::string& name) {
    if (name == "tar.gz") return Kind::TarGz;
    if (name == "zip") return Kind::Zip;
    if (name == "tar") return Kind::Tar;

    std::string valid;
    for (const auto& k : validKinds()) {
        if (!valid.empty()) valid += ", ";
        valid += k;
    }
    throw config::ConfigError("invalid archive format \"" + name + "\": valid formats are " + valid);
}

std::string kindName(Kind kind) {
    switch (kind) {
        case Kind::TarGz: return "tar.gz";
        case Kind::Zip:   return "zip";
        case Kind::Tar:   return "tar";
    }
    return "tar.gz";
}

std::string suffix(Kind kind) {
    return "." + kindName(kind);
}

std::string contentType(Kind kind) {
    switch (kind) {
        case Kind::TarGz: return "application/gzip";
        case Kind::Zip:   return "application/zip";
        case Kind::Tar:   return "application/x-tar";
    }
    return "application/gzip";
}

const std::vector<std::string>& validKinds() {
    static const std::vector<std::string> kinds = {"tar.gz", "zip", "tar"};
    return kinds;
}

void walk(const fs::path& root, const std::function<void(const Entry&)>& visit) {
    auto entry = describe(root, fs::path());
    if (!entry.isDirectory) {
        throw fs::filesystem_error("not a directory", root,
                                   std::make_error_code(std::errc::not_a_directory));
    }
    visit(entry);
    walkDirectory(root, fs::path(), visit);
}

void write(const fs::path& root, const std::string& baseName, Kind kind, io::Writer& out) {
    switch (kind) {
        case Kind::Tar:
            writeTar(root, baseName, out);
            return;
        case Kind::TarGz: {
            compress::GzipWriter gz(out);
            writeTar(root, baseName, gz);
            gz.close();
            return;
        }
        case Kind::Zip:
            writeZip(root, baseName, out);
            return;
    }
}

} // namespace lanserve::archive
