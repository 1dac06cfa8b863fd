#include "Virtualization/vm/VirtualMachine.hpp"
#include "System/Logger.hpp"
#include "Utils/FileUtils.hpp"
#include "Virtualization/builder/QemuCommandBuilder.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <thread>

VirtualMachine::VirtualMachine(VmConfig config, DriverOptions opts, VirtualMachineDependencies dependencies)
    : cfg(std::move(config)),
      options(std::move(opts)),
      deps(std::move(dependencies)),
      supervisor(deps.processRunner, cfg.program),
      bootDisk(deps.processRunner, options.qemuImgProgram) {
    if (!deps.processRunner || !deps.controlChannel || !deps.readinessCheck || !deps.bootMedia ||
        !deps.keyGenerator) {
        throw std::invalid_argument("VirtualMachine '" + cfg.name + "' is missing a collaborator");
    }
}

VirtualMachine::~VirtualMachine() = default;

void VirtualMachine::preCreateCheck() const {
    auto res = options.validate();
    if (res.isErr()) throw ConfigError(res.unwrapErr());
}

void VirtualMachine::create() {
    std::scoped_lock lock(opMutex);
    preCreateCheck();

    const auto leased = ports.allocateDistinct(2);
    {
        std::scoped_lock cfgLock(cfgMutex);
        cfg.sshPort = leased[0];
        cfg.enginePort = leased[1];
    }
    QHLOG_DEBUG("'{}' forwards ssh from {} and engine from {}", cfg.name, cfg.sshPort, cfg.enginePort);

    std::error_code ec;
    std::filesystem::create_directories(cfg.machineDir(), ec);
    if (ec) throw BuildFailure("cannot create " + cfg.machineDir().string() + ": " + ec.message());

    deps.bootMedia->stage(cfg.bootMediaSource, cfg.bootMediaPath());

    QHLOG_INFO("Creating SSH key...");
    deps.keyGenerator->generate(cfg.sshKeyPath());
    auto publicKey = FileUtils::readFile(cfg.publicKeyPath());
    if (publicKey.isErr()) throw BuildFailure("ssh public key: " + publicKey.unwrapErr());

    QHLOG_INFO("Creating Disk image...");
    bootDisk.build(cfg.diskPath(), publicKey.unwrap(), cfg.diskSize);

    if (!cfg.userDataFile.empty()) {
        QHLOG_INFO("Creating Userdata Disk...");
        auto userData = FileUtils::readFile(cfg.userDataFile);
        if (userData.isErr()) throw BuildFailure("user data: " + userData.unwrapErr());
        auto seedRoot = seedDisk.build(cfg.machineDir(), userData.unwrap()).string();
        std::scoped_lock cfgLock(cfgMutex);
        cfg.cloudConfigRoot = std::move(seedRoot);
    }

    cfg.save();

    QHLOG_INFO("Starting QEMU VM...");
    startLocked(false);
}

void VirtualMachine::start() {
    std::scoped_lock lock(opMutex);
    startLocked(false);
}

void VirtualMachine::stop() {
    std::scoped_lock lock(opMutex);
    stopLocked();
}

void VirtualMachine::kill() {
    std::scoped_lock lock(opMutex);
    killLocked();
}

void VirtualMachine::restart() {
    std::scoped_lock lock(opMutex);
    const auto report = queryStateLocked();
    if (report.state == VmState::Error) throw StateQueryFailure(report.cause);

    if (report.state == VmState::Running) {
        stopLocked();
        waitForStateLocked({VmState::Stopped, VmState::Error}, "power off");
    }
    startLocked(true);
}

void VirtualMachine::remove() {
    std::scoped_lock lock(opMutex);
    const auto report = queryStateLocked();
    if (report.state == VmState::Error) throw StateQueryFailure(report.cause);

    if (report.state == VmState::Running) {
        killLocked();
    }
    deps.controlChannel->runCommand("quit");
    QHLOG_INFO("'{}' removed; files under {} are kept", cfg.name, cfg.machineDir().string());
}

VirtualMachine::StateReport VirtualMachine::getState() {
    std::scoped_lock lock(opMutex);
    return queryStateLocked();
}

void VirtualMachine::cancelPendingWait() {
    std::scoped_lock lock(tokenMutex);
    waitToken.cancel();
}

int VirtualMachine::getSSHPort() const {
    std::scoped_lock lock(cfgMutex);
    return cfg.sshPort != 0 ? cfg.sshPort : kGuestSshPort;
}

std::string VirtualMachine::getSSHUsername() const {
    return cfg.sshUser.empty() ? "docker" : cfg.sshUser;
}

std::string VirtualMachine::getSSHKeyPath() const {
    return cfg.sshKeyPath().string();
}

int VirtualMachine::getPort() const {
    std::scoped_lock lock(cfgMutex);
    return cfg.enginePort != 0 ? cfg.enginePort : kGuestEnginePort;
}

std::string VirtualMachine::getURL() const {
    return "tcp://" + getIP() + ":" + std::to_string(getPort());
}

VmConfig VirtualMachine::config() const {
    std::scoped_lock lock(cfgMutex);
    return cfg;
}

VirtualMachine::VmState VirtualMachine::mapRunState(std::string_view status) {
    // Everything else QEMU reports (inmigrate, prelaunch, io-error,
    // internal-error, guest-panicked, ...) is a transient or error substate.
    if (status == "running") return VmState::Running;
    if (status == "paused") return VmState::Paused;
    if (status == "shutdown") return VmState::Stopped;
    return VmState::Unknown;
}

std::string_view VirtualMachine::toString(VmState state) noexcept {
    switch (state) {
        case VmState::Running: return "Running";
        case VmState::Paused: return "Paused";
        case VmState::Stopped: return "Stopped";
        case VmState::Error: return "Error";
        case VmState::Unknown: return "Unknown";
    }
    return "Unknown";
}

void VirtualMachine::startLocked(bool replacePaused) {
    const auto token = freshWaitToken();
    retireStaleProcessLocked(replacePaused);

    auto args = QemuCommandBuilder::fromConfig(cfg, deps.host.hardwareAcceleration).build();
    if (args.isErr()) {
        throw ProcessLaunchFailure("invalid instance '" + cfg.name + "': " + args.unwrapErr());
    }
    supervisor.launch(args.unwrap());

    QHLOG_INFO("Waiting for VM to start (ssh -p {} {}@localhost)...", cfg.sshPort, getSSHUsername());
    deps.readinessCheck->waitReady(getIP(), cfg.sshPort, token);
}

void VirtualMachine::stopLocked() {
    deps.controlChannel->runCommand("system_powerdown");
}

void VirtualMachine::killLocked() {
    deps.controlChannel->runCommand(options.killCommand);
}

// A second qemu would take over the monitor path, so any process still answering
// is quit and the launch waits until the monitor stops answering.
void VirtualMachine::retireStaleProcessLocked(bool replacePaused) {
    const auto report = queryStateLocked();
    switch (report.state) {
        case VmState::Error:
            return;
        case VmState::Paused:
            if (replacePaused) break;
            [[fallthrough]];
        case VmState::Running:
            throw ProcessLaunchFailure("'" + cfg.name + "' already has a live hypervisor (" +
                                       std::string(toString(report.state)) + ")");
        case VmState::Stopped:
        case VmState::Unknown:
            break;
    }

    QHLOG_INFO("quitting stale hypervisor of '{}' before launch", cfg.name);
    deps.controlChannel->runCommand("quit");
    waitForStateLocked({VmState::Error}, "exit");
}

void VirtualMachine::waitForStateLocked(std::initializer_list<VmState> targets, const std::string& what) {
    const auto deadline = std::chrono::steady_clock::now() + options.stopTimeout;
    for (;;) {
        const auto report = queryStateLocked();
        if (std::find(targets.begin(), targets.end(), report.state) != targets.end()) return;
        if (std::chrono::steady_clock::now() >= deadline) {
            throw ReadinessTimeout("'" + cfg.name + "' did not " + what + " within " +
                                   std::to_string(options.stopTimeout.count()) + " s");
        }
        std::this_thread::sleep_for(options.statePollInterval);
    }
}

VirtualMachine::StateReport VirtualMachine::queryStateLocked() {
    StateReport report;
    try {
        const auto ret = deps.controlChannel->runCommand("query-status");
        if (ret.is_object() && ret.contains("status") && ret["status"].is_string()) {
            report.state = mapRunState(ret["status"].get<std::string>());
        }
    } catch (const VmException& e) {
        report.state = VmState::Error;
        report.cause = e.what();
    }
    QHLOG_DEBUG("'{}' state: {}", cfg.name, toString(report.state));
    return report;
}

CONCURRENCY::CancellationToken VirtualMachine::freshWaitToken() {
    std::scoped_lock lock(tokenMutex);
    waitToken = CONCURRENCY::CancellationToken();
    return waitToken;
}
