#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include "Core/interfaces/IProcessRunner.hpp"
#include "Core/interfaces/ISshKeyGenerator.hpp"

// RSA keypair via ssh-keygen, without a passphrase.
class SshKeygenGenerator : public ISshKeyGenerator {
public:
    SshKeygenGenerator(std::shared_ptr<IProcessRunner> runner, std::string program = "ssh-keygen", int bits = 2048);

    void generate(const std::filesystem::path& privateKeyPath) override;

private:
    std::shared_ptr<IProcessRunner> runner;
    std::string program;
    int bits;
};
