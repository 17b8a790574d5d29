#include <exception>
#include "file_insights/logging.hpp"
#include "file_insights/media_enricher.hpp"

namespace file_insights {

    namespace {
        std::optional<std::string> non_empty(const std::optional<std::string>& value) {
            if (value && !value->empty()) {
                return value;
            }
            return std::nullopt;
        }

        VideoMetadata normalize(const MediaProbeResult& probed) {
            VideoMetadata metadata;
            if (probed.duration && *probed.duration >= 0.0) {
                metadata.duration = static_cast<double>(*probed.duration);
            }
            if (probed.width && probed.height && *probed.width > 0 && *probed.height > 0) {
                metadata.resolution = Resolution {*probed.width, *probed.height};
            }
            if (probed.fps && *probed.fps > 0.0) {
                metadata.fps = static_cast<double>(*probed.fps);
            }
            metadata.video_codec = non_empty(probed.video_codec);
            metadata.audio_codec = non_empty(probed.audio_codec);
            return metadata;
        }
    }

    MediaEnricher::MediaEnricher(MediaProbe& probe, bool verbose)
        : probe_(probe), verbose_(verbose) {}

    FileRecord MediaEnricher::enrich(FileRecord record) const {
        if (!record.is_video) {
            return record;
        }

        if (record.size < kMinProbeSize) {
            record.probe_status = ProbeStatus::SkippedSmall;
            logger()->debug("Skipping probe of {} ({} bytes)", record.path.string(), record.size);
            return record;
        }

        MediaProbeResult probed;
        try {
            probed = probe_.probe(record.path);
        } catch (const std::exception& ex) {
            probed.error = ex.what();
        } catch (...) {
            probed.error = "unknown exception";
        }

        if (probed.error) {
            record.probe_status = ProbeStatus::Failed;
            record.video = VideoMetadata {};
            if (verbose_) {
                logger()->warn("Unable to extract video metadata for {}: {}", record.path.string(), *probed.error);
            }
            return record;
        }

        record.probe_status = ProbeStatus::Succeeded;
        record.video = normalize(probed);
        if (verbose_) {
            logger()->debug("Video metadata for {}: duration={} fps={}",
                            record.path.string(),
                            record.video.duration.value_or(0.0),
                            record.video.fps.value_or(0.0));
        }
        return record;
    }
}
