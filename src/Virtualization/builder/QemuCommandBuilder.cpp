#include "Virtualization/builder/QemuCommandBuilder.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"

#include <sstream>

QemuCommandBuilder QemuCommandBuilder::fromConfig(const VmConfig& cfg, bool kvmAvailable) {
  QemuCommandBuilder builder;
  builder.setHostname(cfg.name)
      .setMemoryMiB(cfg.memory)
      .setCpuCount(cfg.cpus)
      .setBootMedia(cfg.bootMediaPath().string())
      .setMonitorSocket(cfg.monitorPath().string())
      .setPortForwards(cfg.sshPort, cfg.enginePort)
      .enableKvm(kvmAvailable)
      .setSeedRoot(cfg.cloudConfigRoot)
      .setDisk(cfg.diskPath().string());
  return builder;
}

std::string QemuCommandBuilder::validationError() const {
  if (hostname.empty()) return "instance name is empty";
  if (memoryMiB <= 0) return "memory must be positive";
  if (cpuCount <= 0) return "cpu count must be positive";
  if (bootMedia.empty()) return "boot media path is empty";
  if (monitorSocket.empty()) return "monitor socket path is empty";
  if (diskPath.empty()) return "disk path is empty";
  if (sshHostPort <= 0 || engineHostPort <= 0) return "host ports are not allocated";
  if (sshHostPort == engineHostPort) return "ssh and engine host ports must differ";
  return {};
}

std::string QemuCommandBuilder::networkForwardSpec() const {
  std::ostringstream spec;
  spec << "user,id=net0"
       << ",hostfwd=tcp:127.0.0.1:" << sshHostPort << "-:" << kGuestSshPort
       << ",hostfwd=tcp:127.0.0.1:" << engineHostPort << "-:" << kGuestEnginePort
       << ",hostname=" << hostname;
  return spec.str();
}

Result<std::vector<std::string>> QemuCommandBuilder::build() const {
  if (auto err = validationError(); !err.empty()) {
    return Result<std::vector<std::string>>::fail(err);
  }

  std::vector<std::string> args{
      "-display", "none",
      "-m", std::to_string(memoryMiB),
      "-smp", std::to_string(cpuCount),
      "-boot", "d",
      "-cdrom", bootMedia,
      "-qmp", "unix:" + monitorSocket + ",server,nowait",
      "-netdev", networkForwardSpec(),
      "-device", "virtio-net-pci,netdev=net0",
  };

  if (kvm) {
    args.emplace_back("-enable-kvm");
  }

  if (!seedRoot.empty()) {
    args.emplace_back("-fsdev");
    args.emplace_back("local,security_model=passthrough,readonly,id=fsdev0,path=" + seedRoot);
    args.emplace_back("-device");
    args.emplace_back("virtio-9p-pci,id=fs0,fsdev=fsdev0,mount_tag=config-2");
  }

  args.emplace_back("-daemonize");

  // last argument is always the boot disk image
  args.push_back(diskPath);
  return Result<std::vector<std::string>>{std::move(args)};
}

// Fluent interface implementations
QemuCommandBuilder& QemuCommandBuilder::setHostname(std::string_view name) {
  this->hostname = name;
  return *this;
}

QemuCommandBuilder& QemuCommandBuilder::setMemoryMiB(int memory) {
  this->memoryMiB = memory;
  return *this;
}

QemuCommandBuilder& QemuCommandBuilder::setCpuCount(int cpus) {
  this->cpuCount = cpus;
  return *this;
}

QemuCommandBuilder& QemuCommandBuilder::setBootMedia(std::string_view isoPath) {
  this->bootMedia = isoPath;
  return *this;
}

QemuCommandBuilder& QemuCommandBuilder::setMonitorSocket(std::string_view socketPath) {
  this->monitorSocket = socketPath;
  return *this;
}

QemuCommandBuilder& QemuCommandBuilder::setPortForwards(int sshPort, int enginePort) {
  this->sshHostPort = sshPort;
  this->engineHostPort = enginePort;
  return *this;
}

QemuCommandBuilder& QemuCommandBuilder::enableKvm(bool enabled) {
  this->kvm = enabled;
  return *this;
}

QemuCommandBuilder& QemuCommandBuilder::setSeedRoot(std::string_view rootPath) {
  this->seedRoot = rootPath;
  return *this;
}

QemuCommandBuilder& QemuCommandBuilder::setDisk(std::string_view path) {
  this->diskPath = path;
  return *this;
}
