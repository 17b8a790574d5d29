#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "file_insights/media_enricher.hpp"
#include "file_insights/types.hpp"

namespace file_insights {
    class FileRecordBuilder {
    public:
        FileRecordBuilder(const ScanConfig& config, const MediaEnricher* enricher);

        std::optional<FileRecord> build(const std::filesystem::path& path,
                                        std::vector<std::string>& warnings) const;

    private:
        const ScanConfig& config_;
        const MediaEnricher* enricher_;
    };
}
