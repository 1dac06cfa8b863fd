#include "Virtualization/vmm/QemuProcessSupervisor.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

QemuProcessSupervisor::QemuProcessSupervisor(std::shared_ptr<IProcessRunner> runner, std::string program)
    : runner(std::move(runner)), qemuProgram(std::move(program)) {}
QemuProcessSupervisor::~QemuProcessSupervisor() = default;

void QemuProcessSupervisor::launch(const std::vector<std::string>& args) {
    if (!runner) throw ProcessLaunchFailure("no process runner configured");

    const ProcessOutput out = runner->run(qemuProgram, args);
    if (auto reason = out.failureReason(); !reason.empty()) {
        QHLOG_ERROR("{} failed to start: {}", qemuProgram, reason);
        if (!out.stdoutText.empty()) QHLOG_ERROR("OUTPUT: {}", out.stdoutText);
        throw ProcessLaunchFailure(qemuProgram + " " + reason, out.stderrText);
    }
    QHLOG_DEBUG("{} daemonized", qemuProgram);
}
