#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/compress.h — Streaming zlib compression (gzip, raw deflate)
// ═══════════════════════════════════════════════════════════════════
//
//  compress::GzipWriter gz(response);
//  tarWriter(gz) ... ;
//  gz.close();   // emits the final deflate block and the gzip trailer
//
// ═══════════════════════════════════════════════════════════════════

#include "io.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <zlib.h>

namespace lanserve::compress {

// ── CRC-32 (zip / gzip polynomial), continuing from `crc` ──
std::uint32_t crc32(std::uint32_t crc, const char* data, std::size_t size);

enum class Format {
    Gzip,   // RFC 1952 header + trailer
    Raw,    // bare deflate stream, as stored inside zip entries
};

// ═══════════════════════════════════════════
//  Deflater — incremental deflate into an io::Writer
// ═══════════════════════════════════════════
class Deflater : public io::Writer {
public:
    using io::Writer::write;

    Deflater(io::Writer& out, Format format, int level = Z_DEFAULT_COMPRESSION);
    ~Deflater() override;

    Deflater(const Deflater&) = delete;
    Deflater& operator=(const Deflater&) = delete;

    void write(const char* data, std::size_t size) override;

    // Flush everything and end the stream. Further writes throw.
    void finish();

    bool finished() const { return finished_; }
    std::uint64_t bytesIn() const { return bytesIn_; }
    std::uint64_t bytesOut() const { return bytesOut_; }

private:
    void pump(int flush);

    io::Writer& out_;
    z_stream zs_{};
    std::array<char, io::CopyBufferSize> buffer_{};
    bool finished_ = false;
    std::uint64_t bytesIn_ = 0;
    std::uint64_t bytesOut_ = 0;
};

// ═══════════════════════════════════════════
//  GzipWriter — io::Writer producing a .gz stream
// ═══════════════════════════════════════════
class GzipWriter : public io::Writer {
public:
    using io::Writer::write;

    explicit GzipWriter(io::Writer& out, int level = Z_DEFAULT_COMPRESSION)
        : deflater_(out, Format::Gzip, level) {}

    void write(const char* data, std::size_t size) override {
        deflater_.write(data, size);
    }

    // Must be called after the inner format (tar) has been closed
    void close() {
        if (!deflater_.finished()) deflater_.finish();
    }

private:
    Deflater deflater_;
};

} // namespace lanserve::compress
