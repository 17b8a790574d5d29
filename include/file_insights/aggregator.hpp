#pragma once
#include <optional>
#include <string>
#include <vector>
#include "file_insights/types.hpp"

namespace file_insights {
    GeneralStats compute_general_stats(const std::vector<FileRecord>& records);
    std::vector<ExtensionStat> compute_extension_stats(const std::vector<FileRecord>& records);
    std::vector<AgeBucket> compute_age_distribution(const std::vector<FileRecord>& records, TimePoint now);
    FileTreeDirectory build_file_tree(const std::vector<FileRecord>& records);
    std::optional<VideoStats> compute_video_stats(const std::vector<FileRecord>& records);
    std::optional<std::vector<DuplicateGroup>> find_duplicates(const std::vector<FileRecord>& records);

    AggregateResult aggregate(const std::vector<FileRecord>& records, TimePoint now);

    const FileTreeEntry* find_child(const FileTreeDirectory& directory, const std::string& name);
}
