#include "Virtualization/Storage/BootDiskBuilder.hpp"
#include "System/Logger.hpp"
#include "Utils/FileUtils.hpp"
#include "Utils/TarArchiveWriter.hpp"
#include "Virtualization/Utils/VmException.hpp"

BootDiskBuilder::BootDiskBuilder(std::shared_ptr<IProcessRunner> runner, std::string qemuImgProgram)
    : runner(std::move(runner)), qemuImg(std::move(qemuImgProgram)) {}

std::string BootDiskBuilder::buildArchive(std::string_view publicKey) {
    TarArchiveWriter tar;
    // marker first so the automount script knows to format the disk
    tar.addFile(kFormatMarker, kFormatMarker, 0644);
    tar.addDirectory(".ssh", 0700);
    tar.addFile(".ssh/authorized_keys", publicKey, 0644);
    tar.addFile(".ssh/authorized_keys2", publicKey, 0644);
    QHLOG_TRACE("boot disk archive holds {} entries", tar.entryCount());
    return tar.finish();
}

void BootDiskBuilder::build(const std::filesystem::path& diskPath, std::string_view publicKey, int sizeMB) {
    QHLOG_DEBUG("Creating {} MB hard disk image...", sizeMB);
    if (sizeMB <= 0) throw BuildFailure("disk size must be positive, got " + std::to_string(sizeMB));

    const std::string archive = buildArchive(publicKey);
    const std::filesystem::path rawFile = diskPath.string() + ".raw";

    auto written = FileUtils::writeFile(rawFile, archive);
    if (written.isErr()) {
        throw BuildFailure("raw image: " + written.unwrapErr());
    }

    runQemuImg({"convert", "-f", "raw", "-O", "qcow2", rawFile.string(), diskPath.string()}, "convert");
    // resize only after conversion; qemu-img cannot grow the tar-sized raw file in place
    runQemuImg({"resize", diskPath.string(), "+" + std::to_string(sizeMB) + "M"}, "resize");

    QHLOG_DEBUG("DONE writing to {} and {}", rawFile.string(), diskPath.string());
}

void BootDiskBuilder::runQemuImg(const std::vector<std::string>& args, std::string_view step) {
    if (!runner) throw BuildFailure("no process runner configured");

    ProcessOutput out;
    try {
        out = runner->run(qemuImg, args);
    } catch (const ProcessLaunchFailure& e) {
        throw BuildFailure(std::string(step) + ": " + e.what());
    }

    if (auto reason = out.failureReason(); !reason.empty()) {
        QHLOG_ERROR("OUTPUT: {}", out.stdoutText);
        QHLOG_ERROR("ERROR: {}", out.stderrText);
        throw BuildFailure(qemuImg + " " + std::string(step) + " " + reason);
    }
}
