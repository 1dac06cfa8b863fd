#pragma once
#include <filesystem>

class ISshKeyGenerator {
public:
    virtual ~ISshKeyGenerator() = default;

    // Writes privateKeyPath and privateKeyPath + ".pub".
    virtual void generate(const std::filesystem::path& privateKeyPath) = 0;
};
