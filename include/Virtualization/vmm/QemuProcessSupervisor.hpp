#pragma once
#include <memory>
#include <string>
#include <vector>
#include "Core/interfaces/IProcessRunner.hpp"

class QemuProcessSupervisor {
public:
    QemuProcessSupervisor(std::shared_ptr<IProcessRunner> runner, std::string program);
    ~QemuProcessSupervisor();

    // Runs the hypervisor with -daemonize in args; returns once the parent process has exited.
    void launch(const std::vector<std::string>& args);

    [[nodiscard]] const std::string& program() const noexcept { return qemuProgram; }

private:
    std::shared_ptr<IProcessRunner> runner;
    std::string qemuProgram;
};
