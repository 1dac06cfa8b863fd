#include "Virtualization/vmm/VirtualMachineFactory.hpp"
#include "Core/process/ProcessRunner.hpp"
#include "System/Logger.hpp"
#include "System/SshKeyGenerator.hpp"
#include "Virtualization/Storage/BootMediaProvider.hpp"
#include "Virtualization/vmm/QmpClient.hpp"
#include "Virtualization/vmm/ReadinessWaiter.hpp"

VirtualMachineFactory::VirtualMachineFactory(DriverOptions opts)
    : options(std::move(opts)) {}
VirtualMachineFactory::~VirtualMachineFactory() = default;

VirtualMachineDependencies VirtualMachineFactory::defaultDependencies(const VmConfig& cfg) const {
    VirtualMachineDependencies deps;
    deps.processRunner = std::make_shared<ProcessRunner>();
    deps.controlChannel = std::make_shared<QmpClient>(cfg.monitorPath(), options.qmpTimeout);

    ReadinessWaiter::Settings readiness;
    readiness.timeout = options.readinessTimeout;
    deps.readinessCheck = std::make_shared<ReadinessWaiter>(readiness);

    deps.bootMedia = std::make_shared<LocalBootMediaProvider>(cfg.storePath);
    deps.keyGenerator = std::make_shared<SshKeygenGenerator>(deps.processRunner, options.sshKeygenProgram);
    deps.host = HostCapabilities::detect(options.kvmDevice);
    if (!deps.host.hardwareAcceleration) {
        QHLOG_WARN("{} not available, running without hardware acceleration", options.kvmDevice);
    }
    return deps;
}

std::unique_ptr<VirtualMachine> VirtualMachineFactory::createNew() const {
    auto cfg = VmConfig::fromOptions(options);
    auto deps = defaultDependencies(cfg);
    return std::make_unique<VirtualMachine>(std::move(cfg), options, std::move(deps));
}

std::unique_ptr<VirtualMachine> VirtualMachineFactory::loadExisting() const {
    auto cfg = VmConfig::load(options.storePath, options.machineName);
    QHLOG_DEBUG("loaded '{}' from {}", cfg.name, cfg.configPath().string());
    auto deps = defaultDependencies(cfg);
    return std::make_unique<VirtualMachine>(std::move(cfg), options, std::move(deps));
}
