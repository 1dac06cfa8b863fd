#include <algorithm>
#include <boost/program_options.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "System/Logger.hpp"
#include "Virtualization/vmm/VirtualMachineFactory.hpp"

namespace po = boost::program_options;

namespace {

const std::vector<std::string> kCommands{
    "create", "start", "stop", "kill", "restart", "remove", "state", "ip", "url", "ssh-port"};

po::options_description buildOptions(DriverOptions& opts, std::string& logLevel, std::string& logFile,
                                     int& readinessSeconds) {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "print this help")
        ("name", po::value(&opts.machineName), "machine name")
        ("store-path", po::value(&opts.storePath), "directory holding machines/<name>/")
        ("qemu-memory", po::value(&opts.memory)->default_value(opts.memory), "memory in MB")
        ("qemu-disk-size", po::value(&opts.diskSize)->default_value(opts.diskSize), "disk size in MB")
        ("qemu-cpu-count", po::value(&opts.cpuCount)->default_value(opts.cpuCount), "number of CPUs")
        ("qemu-program", po::value(&opts.program)->default_value(opts.program), "hypervisor binary")
        ("qemu-img", po::value(&opts.qemuImgProgram)->default_value(opts.qemuImgProgram), "qemu-img binary")
        ("qemu-network", po::value(&opts.network)->default_value(opts.network), "network name")
        ("qemu-network-bridge", po::value(&opts.networkBridge)->default_value(opts.networkBridge),
         "bridge device")
        ("qemu-boot2docker-url", po::value(&opts.boot2DockerUrl), "boot ISO path or file:// URL")
        ("qemu-cache-mode", po::value(&opts.cacheMode)->default_value(opts.cacheMode), "disk cache mode")
        ("qemu-io-mode", po::value(&opts.ioMode)->default_value(opts.ioMode), "disk IO mode")
        ("qemu-ssh-user", po::value(&opts.sshUser)->default_value(opts.sshUser), "guest SSH user")
        ("qemu-userdata", po::value(&opts.userDataFile), "cloud-config user data file")
        ("qemu-kill-command", po::value(&opts.killCommand)->default_value(opts.killCommand),
         "QMP command sent by kill")
        ("readiness-timeout", po::value(&readinessSeconds)->default_value(readinessSeconds),
         "seconds to wait for guest SSH")
        ("log-level", po::value(&logLevel)->default_value(logLevel), "console log level")
        ("log-file", po::value(&logFile)->default_value(logFile), "rotating log file");
    return desc;
}

int runCommand(const std::string& command, const VirtualMachineFactory& factory) {
    if (command == "create") {
        auto vm = factory.createNew();
        vm->create();
        std::cout << vm->getURL() << std::endl;
        return 0;
    }

    auto vm = factory.loadExisting();
    if (command == "start") {
        vm->start();
    } else if (command == "stop") {
        vm->stop();
    } else if (command == "kill") {
        vm->kill();
    } else if (command == "restart") {
        vm->restart();
    } else if (command == "remove") {
        vm->remove();
    } else if (command == "state") {
        const auto report = vm->getState();
        std::cout << VirtualMachine::toString(report.state);
        if (!report.cause.empty()) std::cout << " (" << report.cause << ")";
        std::cout << std::endl;
    } else if (command == "ip") {
        std::cout << vm->getIP() << std::endl;
    } else if (command == "url") {
        std::cout << vm->getURL() << std::endl;
    } else if (command == "ssh-port") {
        std::cout << vm->getSSHPort() << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    DriverOptions opts;
    opts.applyEnvironment();

    std::string logLevel = "info";
    std::string logFile = "logs/qemuhive.log";
    int readinessSeconds = static_cast<int>(opts.readinessTimeout.count());

    auto desc = buildOptions(opts, logLevel, logFile, readinessSeconds);
    po::options_description hidden;
    hidden.add_options()("command", po::value<std::string>(), "lifecycle command");
    po::options_description all;
    all.add(desc).add(hidden);
    po::positional_options_description positional;
    positional.add("command", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "qemuhive: " << e.what() << "\n" << desc << std::endl;
        return 2;
    }

    if (vm.count("help") || !vm.count("command")) {
        std::cout << "Usage: qemuhive <create|start|stop|kill|restart|remove|state|ip|url|ssh-port> "
                     "--name N --store-path P [options]\n"
                  << desc << std::endl;
        return vm.count("help") ? 0 : 2;
    }

    const auto command = vm["command"].as<std::string>();
    if (std::find(kCommands.begin(), kCommands.end(), command) == kCommands.end()) {
        std::cerr << "qemuhive: unknown command '" << command << "'" << std::endl;
        return 2;
    }

    auto level = LoggerConfig::parseLevel(logLevel);
    if (level.isErr()) {
        std::cerr << "qemuhive: " << level.unwrapErr() << std::endl;
        return 2;
    }

    LoggerConfig logConfig;
    logConfig.filePath = logFile;
    logConfig.consoleLevel = level.unwrap();
    SafeLogger::initialize(logConfig);

    opts.readinessTimeout = std::chrono::seconds(readinessSeconds);

    try {
        if (opts.machineName.empty() || opts.storePath.empty()) {
            throw ConfigError("--name and --store-path are required");
        }
        VirtualMachineFactory factory(opts);
        return runCommand(command, factory);
    } catch (const std::exception& e) {
        QHLOG_ERROR("{} '{}' failed: {}", command, opts.machineName, e.what());
        return 1;
    }
}
