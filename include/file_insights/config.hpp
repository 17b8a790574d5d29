#pragma once
#include <optional>
#include <string>
#include <vector>
#include "file_insights/types.hpp"

namespace file_insights {
    const std::vector<std::string>& default_exclude_patterns();
    const std::vector<std::string>& effective_exclude_patterns(const ScanConfig& config);

    std::optional<std::string> validate_scan_config(const ScanConfig& config);
    std::optional<std::string> resolve_connection_string(const StoreOptions& options);
}
