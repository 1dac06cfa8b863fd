#pragma once
#include <string>
#include <string_view>
#include <vector>

struct ProcessOutput {
    int exitCode{0};
    std::string stdoutText;
    std::string stderrText;

    /**
     * @brief Describes why the invocation should be treated as failed
     *
     * Some tools (qemu-img, qemu-system-*) print errors on stderr while
     * exiting with status 0, so the marker is checked even on success.
     *
     * @return Empty string when the invocation succeeded
     */
    [[nodiscard]] std::string failureReason(std::string_view errorMarker = "error:") const {
        if (exitCode != 0) {
            return "exit status " + std::to_string(exitCode) + (stderrText.empty() ? "" : ": " + stderrText);
        }
        if (!errorMarker.empty() && stderrText.find(errorMarker) != std::string::npos) {
            return "reported error: " + stderrText;
        }
        return {};
    }
};

class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    // Runs program directly (no shell) and waits for it; throws ProcessLaunchFailure if it cannot be spawned.
    [[nodiscard]] virtual ProcessOutput run(const std::string& program, const std::vector<std::string>& args) = 0;
};
