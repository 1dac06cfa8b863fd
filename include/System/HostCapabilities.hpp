#pragma once
#include <filesystem>

struct HostCapabilities {
    bool hardwareAcceleration{false};

    // KVM is usable when its device node exists.
    static HostCapabilities detect(const std::filesystem::path& kvmDevice = "/dev/kvm") {
        std::error_code ec;
        HostCapabilities caps;
        caps.hardwareAcceleration = std::filesystem::exists(kvmDevice, ec);
        return caps;
    }
};
