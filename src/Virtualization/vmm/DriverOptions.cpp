#include "Virtualization/vmm/DriverOptions.hpp"

#include <array>
#include <algorithm>
#include <cstdlib>
#include <string_view>

namespace {

constexpr std::array<std::string_view, 6> kCacheModes{
    "default", "none", "writethrough", "writeback", "directsync", "unsafe"};
constexpr std::array<std::string_view, 2> kIoModes{"threads", "native"};

} // namespace

void DriverOptions::applyEnvironment() {
    if (const char* url = std::getenv("QEMU_BOOT2DOCKER_URL"); url && *url) {
        boot2DockerUrl = url;
    }
    if (const char* user = std::getenv("QEMU_SSH_USER"); user && *user) {
        sshUser = user;
    }
}

bool DriverOptions::isKnownCacheMode(const std::string& mode) {
    return std::find(kCacheModes.begin(), kCacheModes.end(), mode) != kCacheModes.end();
}

bool DriverOptions::isKnownIoMode(const std::string& mode) {
    return std::find(kIoModes.begin(), kIoModes.end(), mode) != kIoModes.end();
}

Result<void> DriverOptions::validate() const {
    if (machineName.empty()) return Result<void>::fail("machine name is required");
    if (storePath.empty()) return Result<void>::fail("store path is required");
    if (memory <= 0) return Result<void>::fail("memory must be positive");
    if (cpuCount <= 0) return Result<void>::fail("cpu count must be positive");
    if (diskSize <= 0) return Result<void>::fail("disk size must be positive");
    if (program.empty()) return Result<void>::fail("qemu program is required");
    if (!isKnownCacheMode(cacheMode)) return Result<void>::fail("unknown cache mode: " + cacheMode);
    if (!isKnownIoMode(ioMode)) return Result<void>::fail("unknown io mode: " + ioMode);
    return Result<void>::ok();
}
