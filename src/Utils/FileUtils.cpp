#include "Utils/FileUtils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace FileUtils {

Result<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::fail("cannot open " + path.string() + ": " + std::strerror(errno));
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result<std::string>::fail("cannot read " + path.string());
    }
    return Result<std::string>{std::move(bytes)};
}

Result<void> writeFile(const std::filesystem::path& path, std::string_view bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::fail("cannot open " + path.string() + ": " + std::strerror(errno));
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        return Result<void>::fail("cannot write " + path.string() + ": " + std::strerror(errno));
    }
    return Result<void>::ok();
}

} // namespace FileUtils
