#pragma once
#include <nlohmann/json.hpp>
#include <string>

/**
 * @brief Request/reply channel to a running hypervisor process
 *
 * One call is one complete exchange; implementations keep no session
 * between calls.
 */
class IControlChannel {
public:
    virtual ~IControlChannel() = default;

    /**
     * @brief Executes a management command and returns its result object
     * @param command Command name, e.g. "query-status" or "system_powerdown"
     * @param arguments Optional arguments object; null or empty sends none
     * @throws ProtocolFailure on transport or framing errors
     * @throws CommandFailure when the hypervisor rejects the command
     */
    virtual nlohmann::json runCommand(const std::string& command,
                                      const nlohmann::json& arguments = nlohmann::json()) = 0;
};
