// ═══════════════════════════════════════════════════════════════════
//  src/tar.cpp — ustar header encoding
// ═══════════════════════════════════════════════════════════════════

#include "lanserve/tar.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <stdexcept>

namespace lanserve::tar {

namespace {

// Largest value an 11-digit octal size/mtime field can hold (8 GiB - 1)
constexpr std::uint64_t MaxOctal11 = 077777777777ULL;

constexpr std::size_t NameSize   = 100;
constexpr std::size_t PrefixSize = 155;

using Block = std::array<char, BlockSize>;

void putString(Block& block, std::size_t offset, std::size_t width, const std::string& value) {
    std::memcpy(block.data() + offset, value.data(), std::min(width, value.size()));
}

// Zero-padded octal digits followed by a NUL, filling `width` bytes
void putOctal(Block& block, std::size_t offset, std::size_t width, std::uint64_t value) {
    std::size_t digits = width - 1;
    for (std::size_t i = digits; i-- > 0;) {
        block[offset + i] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
    block[offset + digits] = '\0';
}

std::size_t decimalDigits(std::size_t n) {
    std::size_t d = 1;
    while (n >= 10) { n /= 10; ++d; }
    return d;
}

// "<len> key=value\n" where len counts the whole record
std::string paxRecord(const std::string& key, const std::string& value) {
    std::size_t base = key.size() + value.size() + 3;
    std::size_t length = base + decimalDigits(base);
    if (decimalDigits(length) != decimalDigits(base)) ++length;
    return std::to_string(length) + " " + key + "=" + value + "\n";
}

// Split a long name into ustar prefix + name at a '/' boundary
bool splitUstarName(const std::string& full, std::string& prefix, std::string& name) {
    if (full.size() <= NameSize) {
        prefix.clear();
        name = full;
        return true;
    }
    for (std::size_t p = full.find('/'); p != std::string::npos; p = full.find('/', p + 1)) {
        if (p > PrefixSize) break;
        std::size_t rest = full.size() - p - 1;
        if (rest > 0 && rest <= NameSize) {
            prefix = full.substr(0, p);
            name = full.substr(p + 1);
            return true;
        }
    }
    return false;
}

} // namespace

void Writer::writeHeader(const Header& header) {
    if (closed_) throw std::logic_error("tar: write after close");
    finishEntry();

    if (header.name.empty()) {
        throw std::invalid_argument("tar: empty entry name");
    }

    std::uint64_t size = header.type == EntryType::Directory ? 0 : header.size;

    std::string prefix;
    std::string name;
    bool fits = splitUstarName(header.name, prefix, name);
    if (!fits || size > MaxOctal11) {
        writePaxHeader(header.name, header);
        if (!fits) {
            prefix.clear();
            name = header.name.substr(0, NameSize);
        }
    }

    writeBlockHeader(name, static_cast<char>(header.type), std::min(size, MaxOctal11),
                     header.mode, header.mtime, prefix);

    currentName_ = header.name;
    entrySize_ = size;
    remaining_ = size;
}

void Writer::write(const char* data, std::size_t size) {
    if (closed_) throw std::logic_error("tar: write after close");
    if (size > remaining_) {
        throw std::runtime_error("tar: write too long for entry '" + currentName_ + "'");
    }
    out_.write(data, size);
    remaining_ -= size;
}

void Writer::close() {
    if (closed_) return;
    finishEntry();
    Block zero{};
    out_.write(zero.data(), zero.size());
    out_.write(zero.data(), zero.size());
    closed_ = true;
}

void Writer::finishEntry() {
    if (remaining_ != 0) {
        throw std::runtime_error("tar: entry '" + currentName_ + "' is missing " +
                                 std::to_string(remaining_) + " bytes");
    }
    pad(entrySize_);
    entrySize_ = 0;
}

void Writer::writePaxHeader(const std::string& name, const Header& header) {
    std::string records;
    if (name.size() > NameSize) {
        records += paxRecord("path", name);
    }
    if (header.size > MaxOctal11) {
        records += paxRecord("size", std::to_string(header.size));
    }

    auto slash = name.find_last_of('/');
    std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
    std::string paxName = ("PaxHeaders.0/" + base).substr(0, NameSize);

    writeBlockHeader(paxName, 'x', records.size(), 0644, header.mtime, "");
    out_.write(records.data(), records.size());
    pad(records.size());
}

void Writer::writeBlockHeader(const std::string& name, char typeflag, std::uint64_t size,
                              std::uint32_t mode, std::int64_t mtime, const std::string& prefix) {
    Block block{};
    putString(block, 0, NameSize, name);
    putOctal(block, 100, 8, mode & 07777);
    putOctal(block, 108, 8, 0);   // uid
    putOctal(block, 116, 8, 0);   // gid
    putOctal(block, 124, 12, size);
    putOctal(block, 136, 12, static_cast<std::uint64_t>(std::clamp<std::int64_t>(mtime, 0, MaxOctal11)));
    block[156] = typeflag;
    putString(block, 257, 6, std::string("ustar\0", 6));
    putString(block, 263, 2, "00");
    putString(block, 345, PrefixSize, prefix);

    // Checksum is computed with the checksum field itself set to spaces
    std::memset(block.data() + 148, ' ', 8);
    unsigned int sum = 0;
    for (char c : block) sum += static_cast<unsigned char>(c);
    putOctal(block, 148, 7, sum);
    block[155] = ' ';

    out_.write(block.data(), block.size());
}

void Writer::pad(std::uint64_t written) {
    auto tail = static_cast<std::size_t>(written % BlockSize);
    if (tail == 0) return;
    Block zero{};
    out_.write(zero.data(), BlockSize - tail);
}

} // namespace lanserve::tar
