#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include "file_insights/hash.hpp"
#include "file_insights/media.hpp"
#include "file_insights/utils.hpp"
#include "file_insights/logging.hpp"
#include "file_insights/record_builder.hpp"
#include "file_insights/content_classifier.hpp"

namespace file_insights {

    FileRecordBuilder::FileRecordBuilder(const ScanConfig& config, const MediaEnricher* enricher)
        : config_(config), enricher_(enricher) {}

    std::optional<FileRecord> FileRecordBuilder::build(const std::filesystem::path& path,
                                                       std::vector<std::string>& warnings) const {
        struct stat info {};
        if (stat(path.c_str(), &info) != 0) {
            warnings.push_back("Unable to read metadata of " + path.string() + ": " + std::string(std::strerror(errno)));
            return std::nullopt;
        }
        if (!S_ISREG(info.st_mode)) {
            warnings.push_back("Skipping " + path.string() + ": no longer a regular file");
            return std::nullopt;
        }

        FileRecord record;
        record.path = path;
        record.size = static_cast<uintmax_t>(info.st_size);
        record.extension = lowercase_extension(path);
        record.created_time = to_time_point(info.st_ctim);
        record.modified_time = to_time_point(info.st_mtim);
        record.is_video = is_video_extension(path);

        Classification classification = classify_content(path, record.size);
        record.mime_type = std::move(classification.mime_type);
        record.is_binary = classification.is_binary;
        record.content_preview = std::move(classification.preview);

        if (config_.compute_checksums) {
            record.checksum = compute_sha256(path);
            if (!record.checksum) {
                warnings.push_back("Unable to compute SHA-256 checksum of " + path.string());
            }
        }

        if (enricher_ && record.is_video) {
            record = enricher_->enrich(std::move(record));
        }

        return record;
    }
}
