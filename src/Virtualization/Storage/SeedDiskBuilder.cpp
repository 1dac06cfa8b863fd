#include "Virtualization/Storage/SeedDiskBuilder.hpp"
#include "System/Logger.hpp"
#include "Utils/FileUtils.hpp"
#include "Virtualization/Utils/VmException.hpp"

namespace fs = std::filesystem;

fs::path SeedDiskBuilder::userDataPath(const fs::path& root) {
    return root / "openstack" / "latest" / "user_data";
}

fs::path SeedDiskBuilder::build(const fs::path& machineDir, std::string_view userData) {
    const fs::path root = machineDir / "cloud-config";
    const fs::path target = userDataPath(root);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw BuildFailure("cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    auto written = FileUtils::writeFile(target, userData);
    if (written.isErr()) throw BuildFailure(written.unwrapErr());

    QHLOG_DEBUG("wrote {} bytes of user data to {}", userData.size(), target.string());
    return root;
}
