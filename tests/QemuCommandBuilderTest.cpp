#include <gtest/gtest.h>

#include <algorithm>

#include "Virtualization/builder/QemuCommandBuilder.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"

namespace {

VmConfig sampleConfig() {
    VmConfig cfg;
    cfg.name = "dev";
    cfg.storePath = "/store";
    cfg.memory = 1024;
    cfg.cpus = 2;
    cfg.sshPort = 40022;
    cfg.enginePort = 42376;
    return cfg;
}

bool contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

} // namespace

TEST(QemuCommandBuilderTest, ProducesFixedArgumentOrder) {
    auto res = QemuCommandBuilder::fromConfig(sampleConfig(), false).build();
    ASSERT_TRUE(res.isOk()) << res.unwrapErr();
    const auto args = res.unwrap();

    const std::vector<std::string> expected{
        "-display", "none",
        "-m", "1024",
        "-smp", "2",
        "-boot", "d",
        "-cdrom", "/store/machines/dev/boot2docker.iso",
        "-qmp", "unix:/store/machines/dev/monitor,server,nowait",
        "-netdev", "user,id=net0,hostfwd=tcp:127.0.0.1:40022-:22,hostfwd=tcp:127.0.0.1:42376-:2376,hostname=dev",
        "-device", "virtio-net-pci,netdev=net0",
        "-daemonize",
        "/store/machines/dev/disk.qcow2",
    };
    EXPECT_EQ(args, expected);
}

TEST(QemuCommandBuilderTest, KvmFlagOnlyWhenAvailable) {
    auto with = QemuCommandBuilder::fromConfig(sampleConfig(), true).build().unwrap();
    auto without = QemuCommandBuilder::fromConfig(sampleConfig(), false).build().unwrap();
    EXPECT_TRUE(contains(with, "-enable-kvm"));
    EXPECT_FALSE(contains(without, "-enable-kvm"));
    EXPECT_EQ(with.back(), without.back());
}

TEST(QemuCommandBuilderTest, SeedRootAddsPassthroughDevice) {
    auto cfg = sampleConfig();
    cfg.cloudConfigRoot = "/store/machines/dev/cloud-config";
    const auto args = QemuCommandBuilder::fromConfig(cfg, false).build().unwrap();

    EXPECT_TRUE(contains(args, "local,security_model=passthrough,readonly,id=fsdev0,path=/store/machines/dev/cloud-config"));
    EXPECT_TRUE(contains(args, "virtio-9p-pci,id=fs0,fsdev=fsdev0,mount_tag=config-2"));

    const auto fsdev = std::find(args.begin(), args.end(), "-fsdev") - args.begin();
    const auto daemonize = std::find(args.begin(), args.end(), "-daemonize") - args.begin();
    EXPECT_LT(fsdev, daemonize);
    EXPECT_EQ(args.back(), "/store/machines/dev/disk.qcow2");
}

TEST(QemuCommandBuilderTest, NoSeedDeviceWithoutRoot) {
    const auto args = QemuCommandBuilder::fromConfig(sampleConfig(), false).build().unwrap();
    EXPECT_FALSE(contains(args, "-fsdev"));
}

TEST(QemuCommandBuilderTest, RejectsUnallocatedOrEqualPorts) {
    auto cfg = sampleConfig();
    cfg.sshPort = 0;
    EXPECT_TRUE(QemuCommandBuilder::fromConfig(cfg, false).build().isErr());

    cfg = sampleConfig();
    cfg.enginePort = cfg.sshPort;
    auto res = QemuCommandBuilder::fromConfig(cfg, false).build();
    ASSERT_TRUE(res.isErr());
    EXPECT_NE(res.unwrapErr().find("differ"), std::string::npos);
}

TEST(QemuCommandBuilderTest, RejectsMissingFields) {
    QemuCommandBuilder builder;
    EXPECT_TRUE(builder.build().isErr());

    builder.setHostname("x").setMemoryMiB(512).setCpuCount(1).setBootMedia("/b.iso")
        .setMonitorSocket("/m").setPortForwards(1000, 1001).setDisk("/d.qcow2");
    EXPECT_TRUE(builder.build().isOk());

    builder.setMemoryMiB(0);
    EXPECT_TRUE(builder.build().isErr());
    builder.reset();
    EXPECT_TRUE(builder.build().isErr());
}
