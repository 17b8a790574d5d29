#include <iomanip>
#include <iostream>
#include <sstream>
#include <variant>
#include "file_insights/utils.hpp"
#include "file_insights/report.hpp"
#include "file_insights/render.hpp"

namespace file_insights {

    namespace {
        constexpr const char* kColorReset = "\033[0m";
        constexpr const char* kColorTitle = "\033[1;36m";
        constexpr const char* kColorKey = "\033[1;34m";
        constexpr const char* kColorValue = "\033[1;32m";
        constexpr const char* kColorWarning = "\033[1;33m";
        constexpr const char* kColorDim = "\033[2m";

        constexpr std::size_t kTreeDisplayLimit = 100;

        void render_title(const std::string& title) {
            std::cout << "\n" << kColorTitle << title << kColorReset << "\n";
        }

        void render_row(const std::string& key, const std::string& value) {
            std::cout << kColorKey << key << ": " << kColorValue << value << kColorReset << "\n";
        }

        std::string format_percentage(double value) {
            std::ostringstream out;
            out << std::fixed << std::setprecision(1) << value << "%";
            return out.str();
        }

        std::string format_seconds(double value) {
            std::ostringstream out;
            out << std::fixed << std::setprecision(2) << value << "s";
            return out.str();
        }

        void render_general(const GeneralStats& stats) {
            render_title("General Statistics");
            render_row("Total Files", std::to_string(stats.total_files));
            render_row("Total Size", format_size(stats.total_size));
            render_row("Average File Size", format_size(static_cast<uintmax_t>(stats.average_size)));
            render_row("Oldest File", stats.oldest_file);
            render_row("Newest File", stats.newest_file);
            render_row("Total Directories", std::to_string(stats.total_directories));
        }

        void render_file_types(const std::vector<ExtensionStat>& stats) {
            render_title("File Types");
            for (const auto& stat : stats) {
                const std::string label = stat.extension.empty() ? "(no extension)" : stat.extension;
                std::cout << kColorKey << std::left << std::setw(18) << label << kColorValue
                          << std::right << std::setw(8) << stat.count
                          << std::setw(12) << format_size(stat.total_size)
                          << std::setw(9) << format_percentage(stat.percentage)
                          << kColorReset << "\n";
            }
        }

        void render_age(const std::vector<AgeBucket>& buckets) {
            render_title("File Age Distribution");
            for (const auto& bucket : buckets) {
                render_row(bucket.label, std::to_string(bucket.count) + " files");
            }
        }

        void render_tree_level(const FileTreeDirectory& directory, const std::string& prefix) {
            for (std::size_t i = 0; i < directory.children.size(); ++i) {
                const auto& child = directory.children[i];
                const bool last = i + 1 == directory.children.size();
                std::cout << kColorDim << prefix << (last ? "`-- " : "|-- ") << kColorReset;

                if (const auto* sub = std::get_if<FileTreeDirectory>(&child.node)) {
                    std::cout << kColorKey << child.name << "/" << kColorReset << "\n";
                    render_tree_level(*sub, prefix + (last ? "    " : "|   "));
                } else {
                    const auto& leaf = std::get<FileTreeLeaf>(child.node);
                    std::cout << child.name << " " << kColorDim << "(" << format_size(leaf.size) << ")"
                              << kColorReset << "\n";
                }
            }
        }

        void render_video(const VideoStats& stats) {
            render_title("Video Statistics");
            render_row("Total Videos", std::to_string(stats.total_videos));
            render_row("With Metadata", std::to_string(stats.videos_with_metadata));
            render_row("Total Duration", format_seconds(stats.total_duration));
            render_row("Average Duration", format_seconds(stats.average_duration));

            if (!stats.resolution_counts.empty()) {
                std::cout << kColorKey << "Resolutions:" << kColorReset << "\n";
                for (const auto& entry : stats.resolution_counts) {
                    std::cout << "  " << kColorValue << entry.resolution << kColorReset << ": " << entry.count << "\n";
                }
            }
            if (!stats.codec_counts.empty()) {
                std::cout << kColorKey << "Codecs:" << kColorReset << "\n";
                for (const auto& entry : stats.codec_counts) {
                    std::cout << "  " << kColorValue << entry.codec.value_or("Unknown") << kColorReset
                              << ": " << entry.count << "\n";
                }
            }
        }

        void render_duplicates(const std::vector<DuplicateGroup>& groups) {
            render_title("Duplicate Files");
            if (groups.empty()) {
                std::cout << kColorValue << "No duplicates found" << kColorReset << "\n";
                return;
            }

            uintmax_t wasted = 0;
            for (const auto& group : groups) {
                wasted += group.wasted_bytes;
                std::cout << kColorKey << group.checksum.substr(0, 12) << kColorReset << " "
                          << group.paths.size() << " x " << format_size(group.size)
                          << kColorWarning << " (" << format_size(group.wasted_bytes) << " wasted)"
                          << kColorReset << "\n";
                for (const auto& path : group.paths) {
                    std::cout << "  " << path << "\n";
                }
            }
            render_row("Total Wasted", format_size(wasted));
        }
    }

    void render_scan_summary(const ScanResult& scan) {
        std::cout << kColorValue << "Found " << scan.records.size() << " files" << kColorReset << "\n";
        if (scan.skipped_count > 0) {
            std::cout << kColorWarning << "Skipped " << scan.skipped_count << " unreadable file(s)"
                      << kColorReset << "\n";
        }
        if (scan.cancelled) {
            std::cout << kColorWarning << "Scan interrupted; results are partial" << kColorReset << "\n";
        }
    }

    void render_text(const AggregateResult& result) {
        std::cout << kColorTitle << "File Insights" << kColorReset << kColorDim
                  << " (" << format_time(result.generated_at) << ")" << kColorReset << "\n";

        render_general(result.general);
        render_file_types(result.file_types);
        render_age(result.age_distribution);

        if (result.file_tree.children.size() <= kTreeDisplayLimit) {
            render_title("File Tree");
            std::cout << kColorKey << "Root" << kColorReset << "\n";
            render_tree_level(result.file_tree, "");
        }

        if (result.video_stats) {
            render_video(*result.video_stats);
        }
        if (result.duplicates) {
            render_duplicates(*result.duplicates);
        }
    }

    void render_json(const AggregateResult& result) {
        std::cout << report_to_json(result);
    }
}
