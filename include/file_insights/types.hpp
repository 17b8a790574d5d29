#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace file_insights {
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    enum class ProbeStatus {
        NotApplicable,
        SkippedSmall,
        Succeeded,
        Failed
    };

    struct Resolution {
        int width = 0;
        int height = 0;
    };

    struct VideoMetadata {
        std::optional<double> duration;
        std::optional<Resolution> resolution;
        std::optional<double> fps;
        std::optional<std::string> video_codec;
        std::optional<std::string> audio_codec;
    };

    struct FileRecord {
        std::filesystem::path path;
        uintmax_t size = 0;
        std::string extension;
        // st_ctime on POSIX: the last metadata change, not the birth time.
        TimePoint created_time;
        TimePoint modified_time;
        std::optional<std::string> content_preview;
        std::optional<std::string> mime_type;
        bool is_binary = false;
        bool is_video = false;
        VideoMetadata video;
        ProbeStatus probe_status = ProbeStatus::NotApplicable;
        std::optional<std::string> checksum;

        std::string name() const {
            return path.filename().string();
        }

        bool has_video_metadata() const {
            return is_video && video.duration.has_value();
        }
    };

    struct GeneralStats {
        std::size_t total_files = 0;
        uintmax_t total_size = 0;
        double average_size = 0.0;
        std::string oldest_file = "N/A";
        std::string newest_file = "N/A";
        std::size_t total_directories = 0;
    };

    struct ExtensionStat {
        std::string extension;
        std::size_t count = 0;
        uintmax_t total_size = 0;
        double percentage = 0.0;
    };

    struct AgeBucket {
        std::string label;
        std::size_t count = 0;
    };

    struct FileTreeLeaf {
        uintmax_t size = 0;
        std::string extension;
        bool is_video = false;
        std::optional<VideoMetadata> video;
    };

    struct FileTreeEntry;

    // Children are kept sorted by name.
    struct FileTreeDirectory {
        std::vector<FileTreeEntry> children;
    };

    struct FileTreeEntry {
        std::string name;
        std::variant<FileTreeDirectory, FileTreeLeaf> node;
    };

    struct ResolutionCount {
        std::string resolution;
        std::size_t count = 0;
    };

    struct CodecCount {
        std::optional<std::string> codec;
        std::size_t count = 0;
    };

    struct VideoStats {
        std::size_t total_videos = 0;
        std::size_t videos_with_metadata = 0;
        double total_duration = 0.0;
        double average_duration = 0.0;
        std::vector<ResolutionCount> resolution_counts;
        std::vector<CodecCount> codec_counts;
    };

    struct DuplicateGroup {
        std::string checksum;
        uintmax_t size = 0;
        std::vector<std::string> paths;
        uintmax_t wasted_bytes = 0;
    };

    struct AggregateResult {
        TimePoint generated_at;
        GeneralStats general;
        std::vector<ExtensionStat> file_types;
        std::vector<AgeBucket> age_distribution;
        FileTreeDirectory file_tree;
        std::optional<VideoStats> video_stats;
        std::optional<std::vector<DuplicateGroup>> duplicates;
    };

    struct ScanConfig {
        std::filesystem::path root = ".";
        bool recursive = true;
        std::vector<std::string> exclude_patterns;
        bool extract_video_metadata = false;
        bool compute_checksums = false;
        std::chrono::milliseconds probe_timeout {10000};
        bool verbose = false;
    };

    struct QueryOptions {
        std::size_t limit = 1000;
        bool video_only = false;
        std::vector<std::string> extensions;
    };

    struct StoreOptions {
        bool save = false;
        bool rebuild = false;
        std::optional<std::string> connection;
    };

    struct WalkResult {
        std::vector<std::filesystem::path> files;
        std::vector<std::string> warnings;
    };

    struct ScanResult {
        std::vector<FileRecord> records;
        std::size_t candidate_count = 0;
        std::size_t skipped_count = 0;
        bool cancelled = false;
        std::vector<std::string> warnings;
    };

    enum class Command {
        Scan,
        DbInsights,
        DbClear
    };

    struct CliParseResult {
        bool valid = true;
        bool show_help = false;
        bool json_output = false;
        bool confirmed = false;
        Command command = Command::Scan;
        ScanConfig scan;
        QueryOptions query;
        StoreOptions store;
        std::optional<std::string> output_path;
        std::string error_message;
    };
}
