#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "Utils/Result.hpp"

struct VmConfig;

/**
 * @brief Builder for the qemu-system command line of one instance
 *
 * Produces the argument vector (without the program name) in the fixed
 * order the supervisor expects: display, memory, cpus, boot order and
 * media, QMP socket, port forwards, acceleration, seed filesystem,
 * daemonize, and the boot disk as the last positional argument.
 */
class QemuCommandBuilder {
private:
  std::string hostname;
  int memoryMiB{ 0 };
  int cpuCount{ 0 };
  std::string bootMedia;
  std::string monitorSocket;
  int sshHostPort{ 0 };
  int engineHostPort{ 0 };
  bool kvm{ false };
  std::string seedRoot;
  std::string diskPath;

  [[nodiscard]] std::string validationError() const;
  [[nodiscard]] std::string networkForwardSpec() const;

public:
  QemuCommandBuilder() = default;

  // Fills every field from a persisted instance record.
  static QemuCommandBuilder fromConfig(const VmConfig& cfg, bool kvmAvailable);

  // Builder methods with fluent interface
  QemuCommandBuilder& setHostname(std::string_view name);
  QemuCommandBuilder& setMemoryMiB(int memory);
  QemuCommandBuilder& setCpuCount(int cpus);
  QemuCommandBuilder& setBootMedia(std::string_view isoPath);
  QemuCommandBuilder& setMonitorSocket(std::string_view socketPath);

  /**
   * @brief Sets the host ports forwarded to guest SSH (22) and engine (2376)
   */
  QemuCommandBuilder& setPortForwards(int sshPort, int enginePort);

  QemuCommandBuilder& enableKvm(bool enabled);

  /**
   * @brief Exposes a directory read-only to the guest over 9p (mount tag config-2)
   * @param rootPath Seed root; empty disables the device
   */
  QemuCommandBuilder& setSeedRoot(std::string_view rootPath);

  QemuCommandBuilder& setDisk(std::string_view path);

  /**
   * @brief Validates the collected fields and returns the argument vector
   * @return Error text when a required field is missing or the ports collide
   */
  [[nodiscard]] Result<std::vector<std::string>> build() const;

  void reset() noexcept { *this = QemuCommandBuilder(); }
};
