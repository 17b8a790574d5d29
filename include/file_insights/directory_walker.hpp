#pragma once
#include <atomic>
#include <filesystem>
#include <string>
#include <vector>
#include "file_insights/types.hpp"

namespace file_insights {
    WalkResult walk_directory(const std::filesystem::path& root,
                              bool recursive,
                              const std::vector<std::string>& patterns,
                              const std::atomic<bool>* cancel = nullptr);
}
