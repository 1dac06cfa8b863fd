#pragma once
#include <chrono>
#include <string>
#include "Utils/Result.hpp"

/**
 * @brief User-facing settings for one QEMU instance plus the host tool locations
 *
 * Tool paths are resolved by the caller and passed in here; no component
 * looks them up on its own.
 */
struct DriverOptions {
    std::string machineName;
    std::string storePath;

    int memory{1024};    // MB
    int diskSize{20000}; // MB
    int cpuCount{1};

    std::string program{"qemu-system-x86_64"};
    std::string qemuImgProgram{"qemu-img"};
    std::string sshKeygenProgram{"ssh-keygen"};
    std::string kvmDevice{"/dev/kvm"};

    std::string network{"default"};
    std::string networkBridge{"virbr0"};
    std::string boot2DockerUrl;
    std::string cacheMode{"default"};
    std::string ioMode{"threads"};
    std::string sshUser{"docker"};
    std::string userDataFile;

    // QMP command sent by kill(); stop() always sends system_powerdown.
    std::string killCommand{"system_powerdown"};

    std::chrono::seconds readinessTimeout{600};
    std::chrono::seconds stopTimeout{120};
    std::chrono::milliseconds statePollInterval{1000};
    std::chrono::milliseconds qmpTimeout{10000};

    // Picks up QEMU_BOOT2DOCKER_URL and QEMU_SSH_USER when they are set.
    void applyEnvironment();

    [[nodiscard]] Result<void> validate() const;

    [[nodiscard]] static bool isKnownCacheMode(const std::string& mode);
    [[nodiscard]] static bool isKnownIoMode(const std::string& mode);
};
