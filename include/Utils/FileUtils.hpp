#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include "Utils/Result.hpp"

namespace FileUtils {

// Reads the whole file as raw bytes.
[[nodiscard]] Result<std::string> readFile(const std::filesystem::path& path);

[[nodiscard]] Result<void> writeFile(const std::filesystem::path& path, std::string_view bytes);

} // namespace FileUtils
