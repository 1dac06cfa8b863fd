#pragma once
#include <stdexcept>
#include <string>
#include <utility>

class VmException : public std::runtime_error {
public:
    explicit VmException(const std::string& msg) : std::runtime_error("[VmException] " + msg) {}
};

// Port allocation gave up after its bounded retries.
class AllocationExhausted : public VmException {
public:
    explicit AllocationExhausted(const std::string& msg) : VmException("[Allocation] " + msg) {}
};

// Boot disk, seed disk, key or boot media preparation failed.
class BuildFailure : public VmException {
public:
    explicit BuildFailure(const std::string& msg) : VmException("[Build] " + msg) {}
};

class ProcessLaunchFailure : public VmException {
public:
    explicit ProcessLaunchFailure(const std::string& msg, std::string stderrText = {})
        : VmException("[Launch] " + msg), stderrOutput(std::move(stderrText)) {}

    [[nodiscard]] const std::string& stderrText() const noexcept { return stderrOutput; }

private:
    std::string stderrOutput;
};

// Transport errors and replies that do not follow the QMP shape.
class ProtocolFailure : public VmException {
public:
    explicit ProtocolFailure(const std::string& msg) : VmException("[QMP] " + msg) {}
};

// The hypervisor understood the command and reported that it failed.
class CommandFailure : public VmException {
public:
    CommandFailure(const std::string& command, std::string payload)
        : VmException("[Command] " + command + " failed: " + payload),
          commandName(command), echoedPayload(std::move(payload)) {}

    [[nodiscard]] const std::string& command() const noexcept { return commandName; }
    [[nodiscard]] const std::string& payload() const noexcept { return echoedPayload; }

private:
    std::string commandName;
    std::string echoedPayload;
};

class StateQueryFailure : public ProtocolFailure {
public:
    explicit StateQueryFailure(const std::string& cause) : ProtocolFailure("query-status: " + cause) {}
};

class ReadinessTimeout : public VmException {
public:
    explicit ReadinessTimeout(const std::string& msg) : VmException("[Timeout] " + msg) {}
};

class OperationCancelled : public VmException {
public:
    explicit OperationCancelled(const std::string& msg) : VmException("[Cancelled] " + msg) {}
};

class ConfigError : public VmException {
public:
    explicit ConfigError(const std::string& msg) : VmException("[Config] " + msg) {}
};
