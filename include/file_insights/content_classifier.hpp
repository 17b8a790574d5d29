#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace file_insights {
    constexpr std::size_t kPreviewCharLimit = 1000;
    constexpr uintmax_t kPreviewSizeLimit = 1024 * 1024;

    struct Classification {
        std::optional<std::string> mime_type;
        bool is_binary = false;
        std::optional<std::string> preview;
    };

    std::optional<std::string> guess_mime_type(const std::string& extension);
    bool is_binary_extension(const std::string& extension);
    bool is_text_mime(const std::string& mime_type);
    Classification classify_content(const std::filesystem::path& path, uintmax_t size);
}
