#pragma once
#include <filesystem>
#include <string>

class IBootMediaProvider {
public:
    virtual ~IBootMediaProvider() = default;

    // Places the base boot image named by source at destination.
    virtual void stage(const std::string& source, const std::filesystem::path& destination) = 0;
};
