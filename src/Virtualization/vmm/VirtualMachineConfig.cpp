#include "Virtualization/vmm/VirtualMachineConfig.hpp"
#include "Utils/FileUtils.hpp"
#include "Virtualization/Utils/VmException.hpp"

namespace fs = std::filesystem;

fs::path VmConfig::machineDir() const { return fs::path(storePath) / "machines" / name; }
fs::path VmConfig::diskPath() const { return machineDir() / "disk.qcow2"; }
fs::path VmConfig::rawDiskPath() const { return machineDir() / "disk.qcow2.raw"; }
fs::path VmConfig::bootMediaPath() const { return machineDir() / "boot2docker.iso"; }
fs::path VmConfig::monitorPath() const { return machineDir() / "monitor"; }
fs::path VmConfig::sshKeyPath() const { return machineDir() / "id_rsa"; }
fs::path VmConfig::publicKeyPath() const { return machineDir() / "id_rsa.pub"; }
fs::path VmConfig::configPath() const { return machineDir() / "config.json"; }

VmConfig VmConfig::fromOptions(const DriverOptions& options) {
    VmConfig cfg;
    cfg.name = options.machineName;
    cfg.storePath = options.storePath;
    cfg.memory = options.memory;
    cfg.cpus = options.cpuCount;
    cfg.diskSize = options.diskSize;
    cfg.cacheMode = options.cacheMode;
    cfg.ioMode = options.ioMode;
    cfg.program = options.program;
    cfg.sshUser = options.sshUser;
    cfg.network = options.network;
    cfg.networkBridge = options.networkBridge;
    cfg.bootMediaSource = options.boot2DockerUrl;
    cfg.userDataFile = options.userDataFile;
    return cfg;
}

bool VmConfig::validate() const {
    if (name.empty() || storePath.empty()) return false;
    if (memory <= 0 || cpus <= 0 || diskSize <= 0) return false;
    if (sshPort < 0 || sshPort > 65535 || enginePort < 0 || enginePort > 65535) return false;
    if (sshPort != 0 && sshPort == enginePort) return false;
    return true;
}

nlohmann::json VmConfig::toJson() const {
    return nlohmann::json{
        {"MachineName", name},
        {"StorePath", storePath},
        {"Memory", memory},
        {"CPU", cpus},
        {"DiskSize", diskSize},
        {"SSHPort", sshPort},
        {"EnginePort", enginePort},
        {"CacheMode", cacheMode},
        {"IOMode", ioMode},
        {"Program", program},
        {"SSHUser", sshUser},
        {"Network", network},
        {"NetworkBridge", networkBridge},
        {"Boot2DockerURL", bootMediaSource},
        {"UserDataFile", userDataFile},
        {"CloudConfigRoot", cloudConfigRoot},
    };
}

VmConfig VmConfig::fromJson(const nlohmann::json& j) {
    VmConfig cfg;
    try {
        cfg.name = j.at("MachineName").get<std::string>();
        cfg.storePath = j.at("StorePath").get<std::string>();
        cfg.memory = j.value("Memory", cfg.memory);
        cfg.cpus = j.value("CPU", cfg.cpus);
        cfg.diskSize = j.value("DiskSize", cfg.diskSize);
        cfg.sshPort = j.value("SSHPort", 0);
        cfg.enginePort = j.value("EnginePort", 0);
        cfg.cacheMode = j.value("CacheMode", cfg.cacheMode);
        cfg.ioMode = j.value("IOMode", cfg.ioMode);
        cfg.program = j.value("Program", cfg.program);
        cfg.sshUser = j.value("SSHUser", cfg.sshUser);
        cfg.network = j.value("Network", cfg.network);
        cfg.networkBridge = j.value("NetworkBridge", cfg.networkBridge);
        cfg.bootMediaSource = j.value("Boot2DockerURL", std::string());
        cfg.userDataFile = j.value("UserDataFile", std::string());
        cfg.cloudConfigRoot = j.value("CloudConfigRoot", std::string());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("malformed instance record: ") + e.what());
    }
    if (!cfg.validate()) {
        throw ConfigError("invalid instance record for '" + cfg.name + "'");
    }
    return cfg;
}

void VmConfig::save() const {
    std::error_code ec;
    fs::create_directories(machineDir(), ec);
    if (ec) {
        throw ConfigError("cannot create " + machineDir().string() + ": " + ec.message());
    }
    auto res = FileUtils::writeFile(configPath(), toJson().dump(4));
    if (res.isErr()) throw ConfigError(res.unwrapErr());
}

VmConfig VmConfig::load(const fs::path& storePath, const std::string& name) {
    VmConfig located;
    located.storePath = storePath.string();
    located.name = name;

    auto bytes = FileUtils::readFile(located.configPath());
    if (bytes.isErr()) throw ConfigError(bytes.unwrapErr());

    auto j = nlohmann::json::parse(bytes.unwrap(), nullptr, false);
    if (j.is_discarded()) {
        throw ConfigError("cannot parse " + located.configPath().string());
    }
    return fromJson(j);
}
