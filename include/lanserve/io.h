#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/io.h — Byte sinks shared by the HTTP, archive and
//  compression layers
// ═══════════════════════════════════════════════════════════════════
//
//  Writers report failure by throwing; a short write never returns.
//  Everything that produces a body (files, tar, gzip, zip) writes into
//  an io::Writer so layers can be stacked:
//
//    http::Response  <-  compress::GzipWriter  <-  tar::Writer
//
// ═══════════════════════════════════════════════════════════════════

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace lanserve::io {

// Size of the bounded buffer used for every file-to-stream copy
inline constexpr std::size_t CopyBufferSize = 32 * 1024;

// ═══════════════════════════════════════════
//  Writer — abstract byte sink
// ═══════════════════════════════════════════
class Writer {
public:
    virtual ~Writer() = default;

    virtual void write(const char* data, std::size_t size) = 0;

    void write(std::string_view data) {
        write(data.data(), data.size());
    }
};

// ── Writer that appends into a std::string (tests, small bodies) ──
class StringWriter : public Writer {
public:
    using Writer::write;

    void write(const char* data, std::size_t size) override {
        buffer_.append(data, size);
    }

    const std::string& str() const { return buffer_; }
    std::string take() { return std::move(buffer_); }

private:
    std::string buffer_;
};

// ── Writer that tracks how many bytes went through it ──
class CountingWriter : public Writer {
public:
    using Writer::write;

    explicit CountingWriter(Writer& next) : next_(next) {}

    void write(const char* data, std::size_t size) override {
        next_.write(data, size);
        count_ += size;
    }

    std::uint64_t count() const { return count_; }

private:
    Writer& next_;
    std::uint64_t count_ = 0;
};

// ── Copy an input stream to a writer through a bounded buffer ──
//    Returns the number of bytes copied. A read error (badbit) throws
//    std::runtime_error; write errors propagate from the writer.
inline std::uint64_t copy(std::istream& in, Writer& out, const std::string& what = "input") {
    std::array<char, CopyBufferSize> buffer;
    std::uint64_t total = 0;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got > 0) {
            out.write(buffer.data(), static_cast<std::size_t>(got));
            total += static_cast<std::uint64_t>(got);
        }
    }
    if (in.bad()) {
        throw std::runtime_error("read error on " + what);
    }
    return total;
}

} // namespace lanserve::io
