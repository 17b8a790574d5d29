#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "file_insights/types.hpp"

namespace file_insights {
    std::string report_to_json(const AggregateResult& result);
    std::optional<std::string> save_report(const AggregateResult& result, const std::filesystem::path& output);

    std::optional<AggregateResult> report_from_json(const std::string& json, std::string& error);
    std::optional<AggregateResult> load_report(const std::filesystem::path& input, std::string& error);
}
