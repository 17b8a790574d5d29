#include <array>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include "file_insights/utils.hpp"
#include "file_insights/aggregator.hpp"

namespace file_insights {

    namespace {
        struct AgeThreshold {
            const char* label;
            long long max_seconds;
        };

        constexpr std::array<AgeThreshold, 4> kAgeThresholds = {{
            {"Last 24 hours", 86400},
            {"Last 7 days", 604800},
            {"Last 30 days", 2592000},
            {"Last year", 31536000}}};
        constexpr const char* kOlderLabel = "Older";

        std::string describe_file(const FileRecord& record) {
            return record.name() + " (" + format_date(record.created_time) + ")";
        }

        FileTreeDirectory& child_directory(FileTreeDirectory& parent, const std::string& name) {
            auto it = std::lower_bound(parent.children.begin(), parent.children.end(), name,
                                       [](const FileTreeEntry& entry, const std::string& key) {
                                           return entry.name < key;
                                       });
            if (it == parent.children.end() || it->name != name) {
                it = parent.children.insert(it, FileTreeEntry {name, FileTreeDirectory {}});
            } else if (!std::holds_alternative<FileTreeDirectory>(it->node)) {
                // A path recorded as a file earlier now has children; the directory wins.
                it->node = FileTreeDirectory {};
            }
            return std::get<FileTreeDirectory>(it->node);
        }

        void put_leaf(FileTreeDirectory& parent, const std::string& name, FileTreeLeaf leaf) {
            auto it = std::lower_bound(parent.children.begin(), parent.children.end(), name,
                                       [](const FileTreeEntry& entry, const std::string& key) {
                                           return entry.name < key;
                                       });
            if (it != parent.children.end() && it->name == name) {
                if (std::holds_alternative<FileTreeLeaf>(it->node)) {
                    it->node = std::move(leaf);
                }
                return;
            }
            parent.children.insert(it, FileTreeEntry {name, std::move(leaf)});
        }

        template <typename Entry, typename Key, typename Projection>
        void count_into(std::vector<Entry>& counts, const Key& key, Projection project) {
            for (auto& entry : counts) {
                if (project(entry) == key) {
                    ++entry.count;
                    return;
                }
            }
            Entry created {key, 1};
            counts.push_back(std::move(created));
        }

        template <typename Entry>
        void sort_by_count(std::vector<Entry>& counts) {
            std::stable_sort(counts.begin(), counts.end(), [](const Entry& lhs, const Entry& rhs) {
                return lhs.count > rhs.count;
            });
        }
    }

    GeneralStats compute_general_stats(const std::vector<FileRecord>& records) {
        GeneralStats stats;
        if (records.empty()) {
            return stats;
        }

        const FileRecord* oldest = &records.front();
        const FileRecord* newest = &records.front();
        std::unordered_set<std::string> directories;

        for (const auto& record : records) {
            stats.total_size += record.size;
            // Strict comparisons keep the first occurrence on ties.
            if (record.created_time < oldest->created_time) {
                oldest = &record;
            }
            if (record.created_time > newest->created_time) {
                newest = &record;
            }
            directories.insert(record.path.parent_path().string());
        }

        stats.total_files = records.size();
        stats.average_size = static_cast<double>(stats.total_size) / static_cast<double>(records.size());
        stats.oldest_file = describe_file(*oldest);
        stats.newest_file = describe_file(*newest);
        stats.total_directories = directories.size();
        return stats;
    }

    std::vector<ExtensionStat> compute_extension_stats(const std::vector<FileRecord>& records) {
        std::vector<ExtensionStat> stats;
        std::unordered_map<std::string, std::size_t> index_by_extension;
        uintmax_t total_size = 0;

        for (const auto& record : records) {
            total_size += record.size;
            auto [it, inserted] = index_by_extension.emplace(record.extension, stats.size());
            if (inserted) {
                stats.push_back(ExtensionStat {record.extension, 0, 0, 0.0});
            }
            ExtensionStat& stat = stats[it->second];
            ++stat.count;
            stat.total_size += record.size;
        }

        for (auto& stat : stats) {
            stat.percentage = total_size > 0
                ? static_cast<double>(stat.total_size) / static_cast<double>(total_size) * 100.0
                : 0.0;
        }

        std::stable_sort(stats.begin(), stats.end(), [](const ExtensionStat& lhs, const ExtensionStat& rhs) {
            return lhs.total_size > rhs.total_size;
        });
        return stats;
    }

    std::vector<AgeBucket> compute_age_distribution(const std::vector<FileRecord>& records, TimePoint now) {
        std::array<std::size_t, kAgeThresholds.size() + 1> counts {};

        for (const auto& record : records) {
            const auto age = std::chrono::duration_cast<std::chrono::seconds>(now - record.created_time).count();
            std::size_t bucket = kAgeThresholds.size();
            for (std::size_t idx = 0; idx < kAgeThresholds.size(); ++idx) {
                if (age < kAgeThresholds[idx].max_seconds) {
                    bucket = idx;
                    break;
                }
            }
            ++counts[bucket];
        }

        std::vector<AgeBucket> distribution;
        for (std::size_t idx = 0; idx < counts.size(); ++idx) {
            if (counts[idx] == 0) {
                continue;
            }
            const char* label = idx < kAgeThresholds.size() ? kAgeThresholds[idx].label : kOlderLabel;
            distribution.push_back(AgeBucket {label, counts[idx]});
        }
        return distribution;
    }

    FileTreeDirectory build_file_tree(const std::vector<FileRecord>& records) {
        FileTreeDirectory root;

        for (const auto& record : records) {
            // relative_path() drops the root name and the root separator.
            std::vector<std::string> parts;
            for (const auto& part : record.path.relative_path()) {
                const std::string segment = part.string();
                if (segment.empty() || segment == ".") {
                    continue;
                }
                parts.push_back(segment);
            }
            if (parts.empty()) {
                continue;
            }

            FileTreeDirectory* current = &root;
            for (std::size_t idx = 0; idx + 1 < parts.size(); ++idx) {
                current = &child_directory(*current, parts[idx]);
            }

            FileTreeLeaf leaf;
            leaf.size = record.size;
            leaf.extension = record.extension;
            leaf.is_video = record.is_video;
            if (record.has_video_metadata()) {
                leaf.video = record.video;
            }
            put_leaf(*current, parts.back(), std::move(leaf));
        }

        return root;
    }

    std::optional<VideoStats> compute_video_stats(const std::vector<FileRecord>& records) {
        VideoStats stats;

        for (const auto& record : records) {
            if (!record.is_video) {
                continue;
            }
            ++stats.total_videos;
            if (!record.has_video_metadata()) {
                continue;
            }

            ++stats.videos_with_metadata;
            stats.total_duration += *record.video.duration;

            if (record.video.resolution) {
                const std::string key = std::to_string(record.video.resolution->width) + "x" +
                    std::to_string(record.video.resolution->height);
                count_into(stats.resolution_counts, key, [](const ResolutionCount& entry) {
                    return entry.resolution;
                });
            }
            count_into(stats.codec_counts, record.video.video_codec, [](const CodecCount& entry) {
                return entry.codec;
            });
        }

        if (stats.total_videos == 0) {
            return std::nullopt;
        }

        if (stats.videos_with_metadata > 0) {
            stats.average_duration = stats.total_duration / static_cast<double>(stats.videos_with_metadata);
        }
        sort_by_count(stats.resolution_counts);
        sort_by_count(stats.codec_counts);
        return stats;
    }

    std::optional<std::vector<DuplicateGroup>> find_duplicates(const std::vector<FileRecord>& records) {
        std::vector<DuplicateGroup> groups;
        std::unordered_map<std::string, std::size_t> index_by_checksum;
        bool any_checksum = false;

        for (const auto& record : records) {
            if (!record.checksum) {
                continue;
            }
            any_checksum = true;
            auto [it, inserted] = index_by_checksum.emplace(*record.checksum, groups.size());
            if (inserted) {
                groups.push_back(DuplicateGroup {*record.checksum, record.size, {}, 0});
            }
            groups[it->second].paths.push_back(record.path.string());
        }

        if (!any_checksum) {
            return std::nullopt;
        }

        groups.erase(std::remove_if(groups.begin(), groups.end(), [](const DuplicateGroup& group) {
            return group.paths.size() < 2;
        }), groups.end());
        for (auto& group : groups) {
            group.wasted_bytes = group.size * (group.paths.size() - 1);
        }
        std::stable_sort(groups.begin(), groups.end(), [](const DuplicateGroup& lhs, const DuplicateGroup& rhs) {
            return lhs.wasted_bytes > rhs.wasted_bytes;
        });
        return groups;
    }

    AggregateResult aggregate(const std::vector<FileRecord>& records, TimePoint now) {
        AggregateResult result;
        result.generated_at = now;
        result.general = compute_general_stats(records);
        result.file_types = compute_extension_stats(records);
        result.age_distribution = compute_age_distribution(records, now);
        result.file_tree = build_file_tree(records);
        result.video_stats = compute_video_stats(records);
        result.duplicates = find_duplicates(records);
        return result;
    }

    const FileTreeEntry* find_child(const FileTreeDirectory& directory, const std::string& name) {
        auto it = std::lower_bound(directory.children.begin(), directory.children.end(), name,
                                   [](const FileTreeEntry& entry, const std::string& key) {
                                       return entry.name < key;
                                   });
        if (it == directory.children.end() || it->name != name) {
            return nullptr;
        }
        return &*it;
    }
}
