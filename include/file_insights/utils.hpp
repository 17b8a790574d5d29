#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <ctime>
#include "file_insights/types.hpp"

namespace file_insights {
    std::string format_size(uintmax_t size);
    std::string format_time(TimePoint value);
    std::string format_date(TimePoint value);
    std::optional<TimePoint> parse_time(const std::string& text);
    TimePoint to_time_point(const timespec& value);
    std::string to_lowercase(std::string value);
    std::string lowercase_extension(const std::filesystem::path& path);
    std::string json_escape(const std::string& input);

    // Bytes that are not part of valid UTF-8 become U+DC80..U+DCFF, and back.
    std::string escape_stray_bytes(const std::string& input);
    std::string restore_stray_bytes(const std::string& input);
}
