#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/zip.h — Streaming zip encoder
// ═══════════════════════════════════════════════════════════════════
//
//  Entries are written front to back without seeking: file entries set
//  general-purpose flag bit 3 and carry their CRC-32 and sizes in a
//  trailing data descriptor. The central directory is emitted by
//  close(). Zip64 records are added only when a size, offset or the
//  entry count no longer fits the classic fields.
//
// ═══════════════════════════════════════════════════════════════════

#include "compress.h"
#include "io.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lanserve::zip {

enum class Method : std::uint16_t {
    Store   = 0,
    Deflate = 8,
};

struct EntryHeader {
    std::string   name;          // directories end with '/'
    Method        method = Method::Deflate;
    std::uint32_t mode   = 0644; // unix permission bits
    std::int64_t  mtime  = 0;    // seconds since the Unix epoch

    bool isDirectory() const { return !name.empty() && name.back() == '/'; }
};

class Writer : public io::Writer {
public:
    using io::Writer::write;

    explicit Writer(io::Writer& out);
    ~Writer() override;

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Begin a new entry, finishing the previous one
    void createEntry(const EntryHeader& header);

    // Append content to the current entry
    void write(const char* data, std::size_t size) override;

    // Finish the last entry and write the central directory
    void close();

    bool closed() const { return closed_; }

private:
    struct Record {
        std::string   name;
        Method        method;
        std::uint16_t flags;
        std::uint16_t dosTime;
        std::uint16_t dosDate;
        std::uint32_t crc = 0;
        std::uint64_t compressedSize = 0;
        std::uint64_t uncompressedSize = 0;
        std::uint64_t offset = 0;
        std::uint32_t externalAttrs = 0;
    };

    void finishEntry();
    void writeCentralDirectory();

    io::CountingWriter out_;
    std::vector<Record> records_;
    std::unique_ptr<compress::Deflater> deflater_;
    std::unique_ptr<io::CountingWriter> stored_;
    bool entryOpen_ = false;
    bool closed_ = false;
};

} // namespace lanserve::zip
