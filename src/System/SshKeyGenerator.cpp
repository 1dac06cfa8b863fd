#include "System/SshKeyGenerator.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

namespace fs = std::filesystem;

SshKeygenGenerator::SshKeygenGenerator(std::shared_ptr<IProcessRunner> runner, std::string program, int bits)
    : runner(std::move(runner)), program(std::move(program)), bits(bits) {}

void SshKeygenGenerator::generate(const fs::path& privateKeyPath) {
    // ssh-keygen asks before overwriting, and stdin is closed
    std::error_code ec;
    fs::remove(privateKeyPath, ec);
    fs::remove(fs::path(privateKeyPath.string() + ".pub"), ec);

    ProcessOutput out;
    try {
        out = runner->run(program, {"-t", "rsa", "-b", std::to_string(bits), "-N", "", "-q", "-f",
                                    privateKeyPath.string()});
    } catch (const ProcessLaunchFailure& e) {
        throw BuildFailure(std::string("ssh key: ") + e.what());
    }
    if (auto reason = out.failureReason(""); !reason.empty()) {
        throw BuildFailure("ssh key: " + program + " " + reason);
    }
    QHLOG_DEBUG("generated ssh key {}", privateKeyPath.string());
}
