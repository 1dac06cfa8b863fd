#pragma once
#include <string>
#include <vector>
#include "Core/interfaces/IProcessRunner.hpp"

// Spawns external tools with Boost.Process, stdout and stderr captured separately.
class ProcessRunner : public IProcessRunner {
public:
    ProcessRunner() = default;
    ~ProcessRunner() override = default;

    [[nodiscard]] ProcessOutput run(const std::string& program, const std::vector<std::string>& args) override;

    // Resolves a bare program name through PATH; names containing '/' are returned as-is.
    [[nodiscard]] static std::string resolve(const std::string& program);
};
