#pragma once
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include "Core/concurrency/CancellationToken.hpp"
#include "Core/interfaces/IBootMediaProvider.hpp"
#include "Core/interfaces/IControlChannel.hpp"
#include "Core/interfaces/IProcessRunner.hpp"
#include "Core/interfaces/IReadinessCheck.hpp"
#include "Core/interfaces/ISshKeyGenerator.hpp"
#include "System/HostCapabilities.hpp"
#include "Virtualization/Storage/BootDiskBuilder.hpp"
#include "Virtualization/Storage/SeedDiskBuilder.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/vmm/DriverOptions.hpp"
#include "Virtualization/vmm/QemuProcessSupervisor.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"
#include "resources/allocation/PortAllocator.hpp"

struct VirtualMachineDependencies {
    std::shared_ptr<IProcessRunner> processRunner;
    std::shared_ptr<IControlChannel> controlChannel;
    std::shared_ptr<IReadinessCheck> readinessCheck;
    std::shared_ptr<IBootMediaProvider> bootMedia;
    std::shared_ptr<ISshKeyGenerator> keyGenerator;
    HostCapabilities host;
};

/**
 * @brief Lifecycle of one QEMU instance
 *
 * Public operations are synchronous and serialized per instance. Talking
 * to a running instance goes through the control channel only.
 */
class VirtualMachine {
public:
    enum class VmState { Running, Paused, Stopped, Error, Unknown };

    struct StateReport {
        VmState state{VmState::Unknown};
        std::string cause; // set when state == Error
    };

    VirtualMachine(VmConfig config, DriverOptions options, VirtualMachineDependencies deps);
    ~VirtualMachine();

    VirtualMachine(const VirtualMachine&) = delete;
    VirtualMachine& operator=(const VirtualMachine&) = delete;

    void preCreateCheck() const;

    /**
     * @brief Allocates ports, stages media, generates the key, builds the disks and starts
     */
    void create();
    void start();
    void stop();
    void kill();

    /**
     * @brief Stops a running guest, waits for power-off and starts it again
     *
     * A paused hypervisor is quit and replaced; start() refuses one.
     */
    void restart();

    // Kills a running instance and quits the hypervisor; files on disk are kept.
    void remove();

    [[nodiscard]] StateReport getState();

    // Aborts a readiness wait in progress on another thread.
    void cancelPendingWait();

    [[nodiscard]] std::string getIP() const { return "127.0.0.1"; }
    [[nodiscard]] std::string getSSHHostname() const { return "localhost"; }
    [[nodiscard]] int getSSHPort() const;
    [[nodiscard]] std::string getSSHUsername() const;
    [[nodiscard]] std::string getSSHKeyPath() const;
    [[nodiscard]] int getPort() const;
    [[nodiscard]] std::string getURL() const;
    [[nodiscard]] const std::string& getMachineName() const noexcept { return cfg.name; }
    [[nodiscard]] static std::string_view driverName() noexcept { return "qemu"; }
    // Snapshot of the persisted configuration; safe while another operation runs.
    [[nodiscard]] VmConfig config() const;

    [[nodiscard]] static VmState mapRunState(std::string_view status);
    [[nodiscard]] static std::string_view toString(VmState state) noexcept;

private:
    void startLocked(bool replacePaused);
    void stopLocked();
    void killLocked();
    void retireStaleProcessLocked(bool replacePaused);
    void waitForStateLocked(std::initializer_list<VmState> targets, const std::string& what);
    [[nodiscard]] StateReport queryStateLocked();
    [[nodiscard]] CONCURRENCY::CancellationToken freshWaitToken();

    VmConfig cfg;
    DriverOptions options;
    VirtualMachineDependencies deps;

    PortAllocator ports;
    QemuProcessSupervisor supervisor;
    BootDiskBuilder bootDisk;
    SeedDiskBuilder seedDisk;

    std::mutex opMutex;
    // guards the cfg fields create() fills in; accessors take only this one
    mutable std::mutex cfgMutex;
    std::mutex tokenMutex;
    CONCURRENCY::CancellationToken waitToken;
};
