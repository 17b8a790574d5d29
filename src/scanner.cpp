#include "file_insights/config.hpp"
#include "file_insights/scanner.hpp"
#include "file_insights/logging.hpp"
#include "file_insights/record_builder.hpp"
#include "file_insights/directory_walker.hpp"

namespace file_insights {

    namespace {
        constexpr std::size_t kProgressInterval = 500;
    }

    Scanner::Scanner(ScanConfig config, MediaProbe* probe)
        : config_(std::move(config)) {
        if (config_.extract_video_metadata && probe) {
            enricher_ = std::make_unique<MediaEnricher>(*probe, config_.verbose);
        }
    }

    ScanResult Scanner::scan() const {
        const std::atomic<bool> never_cancelled {false};
        return scan(never_cancelled);
    }

    ScanResult Scanner::scan(const std::atomic<bool>& cancel) const {
        ScanResult result;
        auto log = logger();

        WalkResult walked = walk_directory(config_.root, config_.recursive, effective_exclude_patterns(config_), &cancel);
        result.warnings = std::move(walked.warnings);
        result.candidate_count = walked.files.size();
        log->debug("Found {} candidate file(s) under {}", result.candidate_count, config_.root.string());

        const FileRecordBuilder builder(config_, enricher_.get());
        result.records.reserve(walked.files.size());

        std::size_t processed = 0;
        for (const auto& path : walked.files) {
            if (cancel.load(std::memory_order_relaxed)) {
                break;
            }

            if (auto record = builder.build(path, result.warnings)) {
                result.records.push_back(std::move(*record));
            } else {
                ++result.skipped_count;
            }

            if (++processed % kProgressInterval == 0) {
                log->info("Scanned {}/{} files", processed, result.candidate_count);
            }
        }

        result.cancelled = cancel.load(std::memory_order_relaxed);
        if (result.cancelled) {
            log->warn("Scan interrupted after {} of {} files", result.records.size() + result.skipped_count,
                      result.candidate_count);
        }
        for (const auto& warning : result.warnings) {
            log->debug("{}", warning);
        }
        return result;
    }
}
