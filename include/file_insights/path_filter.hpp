#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace file_insights {
    bool matches_pattern(const std::string& text, const std::string& pattern);
    bool should_exclude(const std::filesystem::path& path, const std::vector<std::string>& patterns);
}
