#include "Virtualization/Storage/BootMediaProvider.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

#include <string_view>

namespace fs = std::filesystem;

LocalBootMediaProvider::LocalBootMediaProvider(fs::path storePath) : storePath(std::move(storePath)) {}

fs::path LocalBootMediaProvider::resolveSource(const std::string& source) const {
    if (source.empty()) return storePath / "cache" / "boot2docker.iso";

    constexpr std::string_view fileScheme = "file://";
    if (source.rfind(fileScheme, 0) == 0) return fs::path(source.substr(fileScheme.size()));
    if (source.find("://") != std::string::npos) {
        throw BuildFailure("remote boot media is not fetched here, place it in the cache first: " + source);
    }
    return fs::path(source);
}

void LocalBootMediaProvider::stage(const std::string& source, const fs::path& destination) {
    const fs::path from = resolveSource(source);
    QHLOG_INFO("Copying {} to {}...", from.string(), destination.string());

    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (!ec) fs::copy_file(from, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw BuildFailure("cannot stage boot media " + from.string() + ": " + ec.message());
    }
}
