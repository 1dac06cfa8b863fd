#pragma once

#include "Core/interfaces/IControlChannel.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief QMP client over the instance's Unix-domain monitor socket
 *
 * Every runCommand() opens a fresh connection, discards the greeting,
 * negotiates capabilities, sends one command and reads its reply.
 * Messages are framed by scanning for a complete JSON object, so replies
 * split across reads or batched with events are handled.
 */
class QmpClient : public IControlChannel {
public:
    static constexpr std::string_view kQueryPrefix = "query-";

    explicit QmpClient(std::filesystem::path socketPath,
                       std::chrono::milliseconds ioTimeout = std::chrono::milliseconds(10000));
    ~QmpClient() override = default;

    QmpClient(const QmpClient&) = delete;
    QmpClient& operator=(const QmpClient&) = delete;

    nlohmann::json runCommand(const std::string& command,
                              const nlohmann::json& arguments = nlohmann::json()) override;

    /**
     * @brief Removes the first complete JSON object from pending
     *
     * Leading whitespace (including the CRLF QEMU appends) is skipped.
     * Braces inside string literals are ignored. A line that is not an
     * object, or an object still open at end of line, is returned as-is
     * without its CRLF.
     *
     * @return The object text, or nullopt if pending holds only a prefix
     */
    [[nodiscard]] static std::optional<std::string> extractMessage(std::string& pending);

    [[nodiscard]] static bool isQuery(std::string_view command) noexcept;

private:
    std::filesystem::path path;
    std::chrono::milliseconds ioTimeout;
};
