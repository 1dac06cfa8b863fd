#pragma once
#include <filesystem>
#include <string>
#include "Core/interfaces/IBootMediaProvider.hpp"

/**
 * @brief Copies a locally available boot ISO into the machine directory
 *
 * Accepts a plain path or a file:// URL. An empty source falls back to
 * <store>/cache/boot2docker.iso. Downloading is left to the caching layer
 * of the host tool.
 */
class LocalBootMediaProvider : public IBootMediaProvider {
public:
    explicit LocalBootMediaProvider(std::filesystem::path storePath);

    void stage(const std::string& source, const std::filesystem::path& destination) override;

    [[nodiscard]] std::filesystem::path resolveSource(const std::string& source) const;

private:
    std::filesystem::path storePath;
};
