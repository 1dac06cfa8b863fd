#pragma once
#include <memory>
#include <string>
#include "Virtualization/vm/VirtualMachine.hpp"
#include "Virtualization/vmm/DriverOptions.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"

class VirtualMachineFactory
{
public:
    explicit VirtualMachineFactory(DriverOptions options);
    ~VirtualMachineFactory();

    // ينشئ سجل جهاز جديد من الخيارات (implementation in .cpp)
    [[nodiscard]] std::unique_ptr<VirtualMachine> createNew() const;

    // يحمّل سجل جهاز محفوظ من config.json
    [[nodiscard]] std::unique_ptr<VirtualMachine> loadExisting() const;

    // Real collaborators: Boost.Process runner, QMP on the instance socket, TCP readiness wait.
    [[nodiscard]] VirtualMachineDependencies defaultDependencies(const VmConfig& cfg) const;

private:
    DriverOptions options;
};
