#pragma once
#include <cstddef>
#include <string>
#include <string_view>

/**
 * @brief Builds a POSIX ustar archive in memory
 *
 * Entries are appended in call order. finish() writes the two zero
 * end-of-archive blocks and returns the archive bytes.
 */
class TarArchiveWriter {
public:
    static constexpr std::size_t kBlockSize = 512;

    TarArchiveWriter() = default;

    /**
     * @brief Appends a regular file entry
     * @param name Entry name, at most 100 bytes
     * @param content File bytes, stored verbatim
     * @param mode Permission bits
     */
    TarArchiveWriter& addFile(std::string_view name, std::string_view content, unsigned mode = 0644);

    /**
     * @brief Appends a directory entry
     */
    TarArchiveWriter& addDirectory(std::string_view name, unsigned mode = 0755);

    [[nodiscard]] std::string finish();

    [[nodiscard]] std::size_t entryCount() const noexcept { return entries; }

private:
    void writeHeader(std::string_view name, char typeflag, unsigned mode, std::size_t size);
    void padToBlock();

    std::string buffer;
    std::size_t entries{0};
    bool finished{false};
};
