#ifndef VMCONFIG_H
#define VMCONFIG_H

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "Virtualization/vmm/DriverOptions.hpp"

// Guest-side ends of the host port forwards.
inline constexpr int kGuestSshPort = 22;
inline constexpr int kGuestEnginePort = 2376;

struct VmConfig {
    std::string name;
    std::string storePath;

    // الموارد
    int memory{1024};    // MB
    int cpus{1};
    int diskSize{20000}; // MB

    // forwarded host ports, fixed after create()
    int sshPort{0};
    int enginePort{0};

    std::string cacheMode{"default"};
    std::string ioMode{"threads"};
    std::string program{"qemu-system-x86_64"};
    std::string sshUser{"docker"};
    std::string network{"default"};
    std::string networkBridge{"virbr0"};

    std::string bootMediaSource;
    std::string userDataFile;
    std::string cloudConfigRoot; // empty when no seed disk was built

    // Per-instance layout under <store>/machines/<name>/
    [[nodiscard]] std::filesystem::path machineDir() const;
    [[nodiscard]] std::filesystem::path diskPath() const;
    [[nodiscard]] std::filesystem::path rawDiskPath() const;
    [[nodiscard]] std::filesystem::path bootMediaPath() const;
    [[nodiscard]] std::filesystem::path monitorPath() const;
    [[nodiscard]] std::filesystem::path sshKeyPath() const;
    [[nodiscard]] std::filesystem::path publicKeyPath() const;
    [[nodiscard]] std::filesystem::path configPath() const;

    static VmConfig fromOptions(const DriverOptions& options);

    // التهيئة من/إلى JSON
    static VmConfig fromJson(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json toJson() const;

    void save() const;
    static VmConfig load(const std::filesystem::path& storePath, const std::string& name);

    // التحقق من الصحة
    [[nodiscard]] bool validate() const;
};

#endif // VMCONFIG_H
