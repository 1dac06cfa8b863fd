#include "Utils/TarArchiveWriter.hpp"

#include <array>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <stdexcept>

namespace {

// ustar header field offsets
constexpr std::size_t kNameOffset = 0;
constexpr std::size_t kNameSize = 100;
constexpr std::size_t kModeOffset = 100;
constexpr std::size_t kUidOffset = 108;
constexpr std::size_t kGidOffset = 116;
constexpr std::size_t kSizeOffset = 124;
constexpr std::size_t kMtimeOffset = 136;
constexpr std::size_t kChecksumOffset = 148;
constexpr std::size_t kTypeflagOffset = 156;
constexpr std::size_t kMagicOffset = 257;
constexpr std::size_t kVersionOffset = 263;

void writeOctal(char* field, std::size_t width, unsigned long long value) {
    // width - 1 digits followed by NUL
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1), value);
}

} // namespace

TarArchiveWriter& TarArchiveWriter::addFile(std::string_view name, std::string_view content, unsigned mode) {
    writeHeader(name, '0', mode, content.size());
    buffer.append(content.data(), content.size());
    padToBlock();
    return *this;
}

TarArchiveWriter& TarArchiveWriter::addDirectory(std::string_view name, unsigned mode) {
    writeHeader(name, '5', mode, 0);
    return *this;
}

std::string TarArchiveWriter::finish() {
    if (!finished) {
        buffer.append(2 * kBlockSize, '\0');
        finished = true;
    }
    return buffer;
}

void TarArchiveWriter::writeHeader(std::string_view name, char typeflag, unsigned mode, std::size_t size) {
    if (finished) throw std::logic_error("tar archive already finished");
    if (name.empty() || name.size() > kNameSize) {
        throw std::invalid_argument("tar entry name must be 1-100 bytes: " + std::string(name));
    }

    std::array<char, kBlockSize> header{};
    std::memcpy(header.data() + kNameOffset, name.data(), name.size());
    writeOctal(header.data() + kModeOffset, 8, mode & 07777);
    writeOctal(header.data() + kUidOffset, 8, 0);
    writeOctal(header.data() + kGidOffset, 8, 0);
    writeOctal(header.data() + kSizeOffset, 12, size);
    writeOctal(header.data() + kMtimeOffset, 12, static_cast<unsigned long long>(std::time(nullptr)));
    header[kTypeflagOffset] = typeflag;
    std::memcpy(header.data() + kMagicOffset, "ustar", 6);
    std::memcpy(header.data() + kVersionOffset, "00", 2);

    // Checksum is computed with its own field filled with spaces.
    std::memset(header.data() + kChecksumOffset, ' ', 8);
    unsigned long checksum = 0;
    for (char c : header) checksum += static_cast<unsigned char>(c);
    std::snprintf(header.data() + kChecksumOffset, 8, "%06lo", checksum);
    header[kChecksumOffset + 7] = ' ';

    buffer.append(header.data(), header.size());
    ++entries;
}

void TarArchiveWriter::padToBlock() {
    const std::size_t rem = buffer.size() % kBlockSize;
    if (rem) buffer.append(kBlockSize - rem, '\0');
}
