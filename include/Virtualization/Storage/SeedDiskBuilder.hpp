#pragma once
#include <filesystem>
#include <string_view>

// Lays out cloud-config user data as an OpenStack config-drive tree for 9p passthrough.
class SeedDiskBuilder {
public:
    [[nodiscard]] static std::filesystem::path userDataPath(const std::filesystem::path& root);

    /**
     * @brief Creates <machineDir>/cloud-config/openstack/latest/user_data
     * @return The seed root (<machineDir>/cloud-config)
     * @throws BuildFailure when a directory or the file cannot be written
     */
    [[nodiscard]] std::filesystem::path build(const std::filesystem::path& machineDir, std::string_view userData);
};
