// ═══════════════════════════════════════════════════════════════════
//  src/zip.cpp — Local headers, data descriptors, central directory
// ═══════════════════════════════════════════════════════════════════

#include "lanserve/zip.h"

#include <ctime>
#include <limits>
#include <stdexcept>
#include <utility>

namespace lanserve::zip {

namespace {

constexpr std::uint32_t LocalHeaderSig      = 0x04034b50;
constexpr std::uint32_t DataDescriptorSig   = 0x08074b50;
constexpr std::uint32_t CentralHeaderSig    = 0x02014b50;
constexpr std::uint32_t EndOfCentralSig     = 0x06054b50;
constexpr std::uint32_t Zip64EndSig         = 0x06064b50;
constexpr std::uint32_t Zip64LocatorSig     = 0x07064b50;

constexpr std::uint16_t VersionDefault = 20;
constexpr std::uint16_t VersionZip64   = 45;
constexpr std::uint16_t CreatorUnix    = 3;

constexpr std::uint16_t FlagDataDescriptor = 0x0008;
constexpr std::uint16_t FlagUtf8           = 0x0800;

constexpr std::uint16_t Zip64ExtraId = 0x0001;

constexpr std::uint32_t Max32 = std::numeric_limits<std::uint32_t>::max();
constexpr std::uint16_t Max16 = std::numeric_limits<std::uint16_t>::max();

constexpr std::uint32_t UnixDirMode  = 0040000;
constexpr std::uint32_t UnixFileMode = 0100000;
constexpr std::uint32_t MsDosDirAttr = 0x10;

void put16(std::string& buf, std::uint16_t v) {
    buf.push_back(static_cast<char>(v & 0xff));
    buf.push_back(static_cast<char>((v >> 8) & 0xff));
}

void put32(std::string& buf, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) buf.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
}

void put64(std::string& buf, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) buf.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
}

bool isAscii(const std::string& s) {
    for (unsigned char c : s) {
        if (c >= 0x80) return false;
    }
    return true;
}

// MS-DOS date/time in local time; the format cannot express years before 1980
void toDosTime(std::int64_t mtime, std::uint16_t& dosTime, std::uint16_t& dosDate) {
    std::time_t t = static_cast<std::time_t>(mtime);
    std::tm tm{};
    localtime_r(&t, &tm);
    if (tm.tm_year < 80) {
        tm = std::tm{};
        tm.tm_year = 80;
        tm.tm_mday = 1;
    }
    dosDate = static_cast<std::uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
    dosTime = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
}

} // namespace

Writer::Writer(io::Writer& out) : out_(out) {}

Writer::~Writer() = default;

void Writer::createEntry(const EntryHeader& header) {
    if (closed_) throw std::logic_error("zip: write after close");
    if (header.name.empty()) throw std::invalid_argument("zip: empty entry name");
    if (header.name.size() > Max16) throw std::invalid_argument("zip: entry name too long");
    finishEntry();

    bool dir = header.isDirectory();

    Record rec;
    rec.name   = header.name;
    rec.method = dir ? Method::Store : header.method;
    rec.flags  = dir ? 0 : FlagDataDescriptor;
    if (!isAscii(header.name)) rec.flags |= FlagUtf8;
    rec.offset = out_.count();
    rec.externalAttrs = ((dir ? UnixDirMode : UnixFileMode) | (header.mode & 07777)) << 16;
    if (dir) rec.externalAttrs |= MsDosDirAttr;
    toDosTime(header.mtime, rec.dosTime, rec.dosDate);

    std::string buf;
    put32(buf, LocalHeaderSig);
    put16(buf, VersionDefault);
    put16(buf, rec.flags);
    put16(buf, static_cast<std::uint16_t>(rec.method));
    put16(buf, rec.dosTime);
    put16(buf, rec.dosDate);
    put32(buf, 0);  // crc, compressed and uncompressed size follow in the descriptor
    put32(buf, 0);
    put32(buf, 0);
    put16(buf, static_cast<std::uint16_t>(rec.name.size()));
    put16(buf, 0);
    buf += rec.name;
    out_.write(buf);

    records_.push_back(std::move(rec));
    entryOpen_ = true;

    if (dir) return;
    if (records_.back().method == Method::Deflate) {
        deflater_ = std::make_unique<compress::Deflater>(out_, compress::Format::Raw);
    } else {
        stored_ = std::make_unique<io::CountingWriter>(out_);
    }
}

void Writer::write(const char* data, std::size_t size) {
    if (!entryOpen_) throw std::logic_error("zip: write without an open entry");
    auto& rec = records_.back();
    if (deflater_) {
        deflater_->write(data, size);
    } else if (stored_) {
        stored_->write(data, size);
    } else if (size > 0) {
        throw std::logic_error("zip: directory entry '" + rec.name + "' cannot have content");
    }
    rec.crc = compress::crc32(rec.crc, data, size);
    rec.uncompressedSize += size;
}

void Writer::close() {
    if (closed_) return;
    finishEntry();
    writeCentralDirectory();
    closed_ = true;
}

void Writer::finishEntry() {
    if (!entryOpen_) return;
    auto& rec = records_.back();

    if (deflater_) {
        deflater_->finish();
        rec.compressedSize = deflater_->bytesOut();
        deflater_.reset();
    } else if (stored_) {
        rec.compressedSize = stored_->count();
        stored_.reset();
    }

    if (rec.flags & FlagDataDescriptor) {
        bool zip64 = rec.compressedSize >= Max32 || rec.uncompressedSize >= Max32;
        std::string buf;
        put32(buf, DataDescriptorSig);
        put32(buf, rec.crc);
        if (zip64) {
            put64(buf, rec.compressedSize);
            put64(buf, rec.uncompressedSize);
        } else {
            put32(buf, static_cast<std::uint32_t>(rec.compressedSize));
            put32(buf, static_cast<std::uint32_t>(rec.uncompressedSize));
        }
        out_.write(buf);
    }
    entryOpen_ = false;
}

void Writer::writeCentralDirectory() {
    std::uint64_t start = out_.count();

    for (const auto& rec : records_) {
        bool zip64 = rec.compressedSize >= Max32 || rec.uncompressedSize >= Max32 ||
                     rec.offset >= Max32;
        std::uint16_t version = zip64 ? VersionZip64 : VersionDefault;

        std::string extra;
        if (zip64) {
            put16(extra, Zip64ExtraId);
            put16(extra, 24);
            put64(extra, rec.uncompressedSize);
            put64(extra, rec.compressedSize);
            put64(extra, rec.offset);
        }

        std::string buf;
        put32(buf, CentralHeaderSig);
        put16(buf, static_cast<std::uint16_t>((CreatorUnix << 8) | version));
        put16(buf, version);
        put16(buf, rec.flags);
        put16(buf, static_cast<std::uint16_t>(rec.method));
        put16(buf, rec.dosTime);
        put16(buf, rec.dosDate);
        put32(buf, rec.crc);
        put32(buf, zip64 ? Max32 : static_cast<std::uint32_t>(rec.compressedSize));
        put32(buf, zip64 ? Max32 : static_cast<std::uint32_t>(rec.uncompressedSize));
        put16(buf, static_cast<std::uint16_t>(rec.name.size()));
        put16(buf, static_cast<std::uint16_t>(extra.size()));
        put16(buf, 0);  // comment length
        put16(buf, 0);  // disk number start
        put16(buf, 0);  // internal attributes
        put32(buf, rec.externalAttrs);
        put32(buf, zip64 ? Max32 : static_cast<std::uint32_t>(rec.offset));
        buf += rec.name;
        buf += extra;
        out_.write(buf);
    }

    std::uint64_t end = out_.count();
    std::uint64_t size = end - start;
    std::uint64_t count = records_.size();

    std::string buf;
    if (count >= Max16 || size >= Max32 || start >= Max32) {
        put32(buf, Zip64EndSig);
        put64(buf, 44);  // size of the remaining record
        put16(buf, static_cast<std::uint16_t>((CreatorUnix << 8) | VersionZip64));
        put16(buf, VersionZip64);
        put32(buf, 0);
        put32(buf, 0);
        put64(buf, count);
        put64(buf, count);
        put64(buf, size);
        put64(buf, start);

        put32(buf, Zip64LocatorSig);
        put32(buf, 0);
        put64(buf, end);
        put32(buf, 1);

        count = Max16;
        size = Max32;
        start = Max32;
    }

    put32(buf, EndOfCentralSig);
    put16(buf, 0);
    put16(buf, 0);
    put16(buf, static_cast<std::uint16_t>(count));
    put16(buf, static_cast<std::uint16_t>(count));
    put32(buf, static_cast<std::uint32_t>(size));
    put32(buf, static_cast<std::uint32_t>(start));
    put16(buf, 0);
    out_.write(buf);
}

} // namespace lanserve::zip
