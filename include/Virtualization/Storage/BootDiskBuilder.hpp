#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "Core/interfaces/IProcessRunner.hpp"

/**
 * @brief Builds the boot2docker data disk seeded with the SSH public key
 *
 * The disk starts life as a tar archive written to <disk>.raw. The guest's
 * automount script sees the format marker, formats the disk and extracts
 * the archive into the docker user's home. qemu-img converts the raw file
 * to qcow2 and then grows it to the requested size.
 */
class BootDiskBuilder {
public:
    static constexpr std::string_view kFormatMarker = "boot2docker, please format-me";

    BootDiskBuilder(std::shared_ptr<IProcessRunner> runner, std::string qemuImgProgram);

    /**
     * @brief Returns the archive bytes: marker, .ssh/, authorized_keys, authorized_keys2
     */
    [[nodiscard]] static std::string buildArchive(std::string_view publicKey);

    /**
     * @brief Writes the raw archive, converts it to qcow2 and resizes it
     * @param diskPath Target qcow2 path; the raw image is diskPath + ".raw"
     * @param publicKey Key bytes copied verbatim into both key files
     * @param sizeMB Capacity added on top of the archive
     * @throws BuildFailure on any step; files already written are left in place
     */
    void build(const std::filesystem::path& diskPath, std::string_view publicKey, int sizeMB);

private:
    void runQemuImg(const std::vector<std::string>& args, std::string_view step);

    std::shared_ptr<IProcessRunner> runner;
    std::string qemuImg;
};
