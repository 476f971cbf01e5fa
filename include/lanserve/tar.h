#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/tar.h — Streaming POSIX (ustar/pax) tar encoder
// ═══════════════════════════════════════════════════════════════════
//
//  tar::Writer tw(out);
//  tw.writeHeader({"docs", tar::EntryType::Directory});
//  tw.writeHeader({"docs/a.txt", tar::EntryType::File, 5});
//  tw.write("hello", 5);
//  tw.close();
//
//  Names longer than the ustar name/prefix fields and sizes above
//  8 GiB are carried in a pax extended header.
//
// ═══════════════════════════════════════════════════════════════════

#include "io.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace lanserve::tar {

inline constexpr std::size_t BlockSize = 512;

enum class EntryType : char {
    File      = '0',
    Directory = '5',
};

struct Header {
    std::string   name;
    EntryType     type  = EntryType::File;
    std::uint64_t size  = 0;
    std::uint32_t mode  = 0644;
    std::int64_t  mtime = 0;   // seconds since the Unix epoch
};

class Writer : public io::Writer {
public:
    using io::Writer::write;

    explicit Writer(io::Writer& out) : out_(out) {}

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Start a new entry. The previous entry must have received exactly
    // the number of bytes its header announced.
    void writeHeader(const Header& header);

    // Append content to the current entry
    void write(const char* data, std::size_t size) override;

    // Pad the last entry and write the two zero end-of-archive blocks
    void close();

    bool closed() const { return closed_; }

private:
    void finishEntry();
    void writePaxHeader(const std::string& name, const Header& header);
    void writeBlockHeader(const std::string& name, char typeflag, std::uint64_t size,
                          std::uint32_t mode, std::int64_t mtime, const std::string& prefix);
    void pad(std::uint64_t written);

    io::Writer& out_;
    std::string   currentName_;
    std::uint64_t remaining_ = 0;
    std::uint64_t entrySize_ = 0;
    bool closed_ = false;
};

} // namespace lanserve::tar
