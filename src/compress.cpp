// ═══════════════════════════════════════════════════════════════════
//  src/compress.cpp — zlib-backed deflate streams
// ═══════════════════════════════════════════════════════════════════

#include "lanserve/compress.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace lanserve::compress {

namespace {

std::string zlibMessage(const z_stream& zs, int code) {
    if (zs.msg) return zs.msg;
    return "zlib error " + std::to_string(code);
}

} // namespace

std::uint32_t crc32(std::uint32_t crc, const char* data, std::size_t size) {
    uLong value = crc;
    while (size > 0) {
        auto chunk = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
        value = ::crc32(value, reinterpret_cast<const Bytef*>(data), chunk);
        data += chunk;
        size -= chunk;
    }
    return static_cast<std::uint32_t>(value);
}

Deflater::Deflater(io::Writer& out, Format format, int level)
    : out_(out) {
    // 15 window bits; +16 selects the gzip wrapper, negative selects raw
    int windowBits = format == Format::Gzip ? 15 + 16 : -15;
    int rc = deflateInit2(&zs_, level, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw std::runtime_error("deflateInit2 failed: " + zlibMessage(zs_, rc));
    }
}

Deflater::~Deflater() {
    deflateEnd(&zs_);
}

void Deflater::write(const char* data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("write after deflate stream was finished");
    }
    while (size > 0) {
        auto chunk = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
        zs_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
        zs_.avail_in = chunk;
        pump(Z_NO_FLUSH);
        bytesIn_ += chunk;
        data += chunk;
        size -= chunk;
    }
}

void Deflater::finish() {
    if (finished_) return;
    zs_.next_in = nullptr;
    zs_.avail_in = 0;
    pump(Z_FINISH);
    finished_ = true;
}

void Deflater::pump(int flush) {
    for (;;) {
        zs_.next_out = reinterpret_cast<Bytef*>(buffer_.data());
        zs_.avail_out = static_cast<uInt>(buffer_.size());

        int rc = deflate(&zs_, flush);
        if (rc == Z_STREAM_ERROR) {
            throw std::runtime_error("deflate failed: " + zlibMessage(zs_, rc));
        }

        auto produced = buffer_.size() - zs_.avail_out;
        if (produced > 0) {
            out_.write(buffer_.data(), produced);
            bytesOut_ += produced;
        }

        if (flush == Z_FINISH) {
            if (rc == Z_STREAM_END) return;
        } else if (zs_.avail_in == 0 && zs_.avail_out != 0) {
            return;
        }
    }
}

} // namespace lanserve::compress
