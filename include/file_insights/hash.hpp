#pragma once
#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace file_insights {
    std::optional<std::string> sha256_hex(std::istream& input);
    std::optional<std::string> compute_sha256(const std::filesystem::path& path);
}
