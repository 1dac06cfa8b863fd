#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "TempDir.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/vmm/DriverOptions.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"

TEST(DriverOptionsTest, DefaultsMatchTheDriverFlags) {
    DriverOptions opts;
    EXPECT_EQ(opts.memory, 1024);
    EXPECT_EQ(opts.diskSize, 20000);
    EXPECT_EQ(opts.cpuCount, 1);
    EXPECT_EQ(opts.program, "qemu-system-x86_64");
    EXPECT_EQ(opts.network, "default");
    EXPECT_EQ(opts.networkBridge, "virbr0");
    EXPECT_EQ(opts.cacheMode, "default");
    EXPECT_EQ(opts.ioMode, "threads");
    EXPECT_EQ(opts.sshUser, "docker");
    EXPECT_EQ(opts.killCommand, "system_powerdown");
}

TEST(DriverOptionsTest, ValidateRejectsBadValues) {
    DriverOptions opts;
    EXPECT_TRUE(opts.validate().isErr());

    opts.machineName = "dev";
    opts.storePath = "/tmp/store";
    EXPECT_TRUE(opts.validate().isOk());

    opts.cacheMode = "sometimes";
    EXPECT_NE(opts.validate().unwrapErr().find("cache mode"), std::string::npos);
    opts.cacheMode = "writeback";
    opts.ioMode = "native";
    EXPECT_TRUE(opts.validate().isOk());

    opts.memory = 0;
    EXPECT_TRUE(opts.validate().isErr());
}

TEST(DriverOptionsTest, EnvironmentOverridesUrlAndUser) {
    ::setenv("QEMU_BOOT2DOCKER_URL", "file:///isos/b2d.iso", 1);
    ::setenv("QEMU_SSH_USER", "core", 1);
    DriverOptions opts;
    opts.applyEnvironment();
    ::unsetenv("QEMU_BOOT2DOCKER_URL");
    ::unsetenv("QEMU_SSH_USER");

    EXPECT_EQ(opts.boot2DockerUrl, "file:///isos/b2d.iso");
    EXPECT_EQ(opts.sshUser, "core");
}

TEST(VmConfigTest, PerInstanceLayout) {
    VmConfig cfg;
    cfg.storePath = "/store";
    cfg.name = "dev";
    EXPECT_EQ(cfg.machineDir().string(), "/store/machines/dev");
    EXPECT_EQ(cfg.diskPath().filename().string(), "disk.qcow2");
    EXPECT_EQ(cfg.rawDiskPath().filename().string(), "disk.qcow2.raw");
    EXPECT_EQ(cfg.bootMediaPath().filename().string(), "boot2docker.iso");
    EXPECT_EQ(cfg.monitorPath().filename().string(), "monitor");
    EXPECT_EQ(cfg.sshKeyPath().filename().string(), "id_rsa");
    EXPECT_EQ(cfg.publicKeyPath().filename().string(), "id_rsa.pub");
    EXPECT_EQ(cfg.configPath().filename().string(), "config.json");
}

TEST(VmConfigTest, SaveThenLoadKeepsAllocatedPorts) {
    TempDir dir;
    DriverOptions opts;
    opts.machineName = "dev";
    opts.storePath = dir.path().string();
    opts.memory = 2048;
    opts.cpuCount = 4;
    opts.userDataFile = "/tmp/user-data.yml";

    auto cfg = VmConfig::fromOptions(opts);
    cfg.sshPort = 40022;
    cfg.enginePort = 42376;
    cfg.cloudConfigRoot = (cfg.machineDir() / "cloud-config").string();
    cfg.save();
    ASSERT_TRUE(std::filesystem::exists(cfg.configPath()));

    const auto loaded = VmConfig::load(dir.path(), "dev");
    EXPECT_EQ(loaded.toJson(), cfg.toJson());
    EXPECT_EQ(loaded.sshPort, 40022);
    EXPECT_EQ(loaded.enginePort, 42376);
    EXPECT_EQ(loaded.memory, 2048);
    EXPECT_EQ(loaded.cpus, 4);
}

TEST(VmConfigTest, RecordUsesDriverKeyNames) {
    VmConfig cfg;
    cfg.name = "dev";
    cfg.storePath = "/store";
    const auto j = cfg.toJson();
    for (const char* key : {"MachineName", "StorePath", "Memory", "CPU", "DiskSize", "SSHPort", "EnginePort",
                            "CacheMode", "IOMode", "Program", "SSHUser", "Boot2DockerURL", "UserDataFile"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
}

TEST(VmConfigTest, MalformedRecordsAreConfigErrors) {
    EXPECT_THROW(VmConfig::fromJson(nlohmann::json{{"StorePath", "/s"}}), ConfigError);
    EXPECT_THROW(VmConfig::fromJson(nlohmann::json{{"MachineName", 7}, {"StorePath", "/s"}}), ConfigError);
    EXPECT_THROW(VmConfig::fromJson(nlohmann::json{
                     {"MachineName", "dev"}, {"StorePath", "/s"}, {"SSHPort", 5000}, {"EnginePort", 5000}}),
                 ConfigError);
}

TEST(VmConfigTest, LoadingUnknownMachineIsConfigError) {
    TempDir dir;
    EXPECT_THROW(VmConfig::load(dir.path(), "ghost"), ConfigError);

    VmConfig cfg;
    cfg.name = "broken";
    cfg.storePath = dir.path().string();
    std::filesystem::create_directories(cfg.machineDir());
    {
        std::ofstream out(cfg.configPath());
        out << "{not json";
    }
    EXPECT_THROW(VmConfig::load(dir.path(), "broken"), ConfigError);
}
