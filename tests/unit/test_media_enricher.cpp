#include <gtest/gtest.h>
#include <stdexcept>
#include "file_insights/media_enricher.hpp"
#include "TestHelpers.hpp"

using namespace file_insights;

namespace {
    class FakeProbe : public MediaProbe {
    public:
        explicit FakeProbe(MediaProbeResult result) : result_(std::move(result)) {}

        MediaProbeResult probe(const std::filesystem::path&) override {
            ++calls;
            return result_;
        }

        int calls = 0;

    private:
        MediaProbeResult result_;
    };

    class ThrowingProbe : public MediaProbe {
    public:
        MediaProbeResult probe(const std::filesystem::path& path) override {
            throw std::runtime_error("decoder crashed on " + path.string());
        }
    };

    class IntThrowingProbe : public MediaProbe {
    public:
        MediaProbeResult probe(const std::filesystem::path&) override {
            throw 42;
        }
    };

    FileRecord video_record(uintmax_t size) {
        FileRecord record = make_record("/videos/clip.mp4", size);
        record.is_video = true;
        return record;
    }
}

TEST(MediaEnricherTest, NonVideoRecordIsUntouched) {
    FakeProbe probe(MediaProbeResult {});
    MediaEnricher enricher(probe, false);

    const auto record = enricher.enrich(make_record("/docs/a.txt", 50000));
    EXPECT_EQ(probe.calls, 0);
    EXPECT_EQ(record.probe_status, ProbeStatus::NotApplicable);
    EXPECT_FALSE(record.has_video_metadata());
}

TEST(MediaEnricherTest, SmallVideoIsNotProbed) {
    FakeProbe probe(MediaProbeResult {});
    MediaEnricher enricher(probe, false);

    const auto record = enricher.enrich(video_record(kMinProbeSize - 1));
    EXPECT_EQ(probe.calls, 0);
    EXPECT_EQ(record.probe_status, ProbeStatus::SkippedSmall);
    EXPECT_FALSE(record.video.duration.has_value());
}

TEST(MediaEnricherTest, SuccessfulProbeFillsMetadata) {
    MediaProbeResult probed;
    probed.duration = 12.5;
    probed.width = 1920;
    probed.height = 1080;
    probed.fps = 29.97;
    probed.video_codec = "h264";
    probed.audio_codec = "aac";
    FakeProbe probe(probed);
    MediaEnricher enricher(probe, true);

    const auto record = enricher.enrich(video_record(kMinProbeSize));
    EXPECT_EQ(probe.calls, 1);
    EXPECT_EQ(record.probe_status, ProbeStatus::Succeeded);
    ASSERT_TRUE(record.has_video_metadata());
    EXPECT_DOUBLE_EQ(*record.video.duration, 12.5);
    ASSERT_TRUE(record.video.resolution.has_value());
    EXPECT_EQ(record.video.resolution->width, 1920);
    EXPECT_EQ(record.video.resolution->height, 1080);
    EXPECT_DOUBLE_EQ(*record.video.fps, 29.97);
    EXPECT_EQ(record.video.video_codec, std::optional<std::string>("h264"));
    EXPECT_EQ(record.video.audio_codec, std::optional<std::string>("aac"));
}

TEST(MediaEnricherTest, ImplausibleValuesAreDropped) {
    MediaProbeResult probed;
    probed.duration = 3.0;
    probed.width = 0;
    probed.height = 720;
    probed.fps = 0.0;
    probed.video_codec = "";
    FakeProbe probe(probed);
    MediaEnricher enricher(probe, false);

    const auto record = enricher.enrich(video_record(200000));
    EXPECT_EQ(record.probe_status, ProbeStatus::Succeeded);
    EXPECT_TRUE(record.has_video_metadata());
    EXPECT_FALSE(record.video.resolution.has_value());
    EXPECT_FALSE(record.video.fps.has_value());
    EXPECT_FALSE(record.video.video_codec.has_value());
    EXPECT_FALSE(record.video.audio_codec.has_value());
}

TEST(MediaEnricherTest, ProbeErrorLeavesRecordWithoutMetadata) {
    MediaProbeResult probed;
    probed.duration = 5.0;
    probed.error = "no video stream";
    FakeProbe probe(probed);
    MediaEnricher enricher(probe, true);

    const auto record = enricher.enrich(video_record(200000));
    EXPECT_EQ(record.probe_status, ProbeStatus::Failed);
    EXPECT_TRUE(record.is_video);
    EXPECT_FALSE(record.has_video_metadata());
}

TEST(MediaEnricherTest, ThrowingProbeIsContained) {
    ThrowingProbe probe;
    MediaEnricher enricher(probe, false);

    FileRecord record;
    ASSERT_NO_THROW(record = enricher.enrich(video_record(200000)));
    EXPECT_EQ(record.probe_status, ProbeStatus::Failed);
    EXPECT_FALSE(record.has_video_metadata());
    EXPECT_EQ(record.size, 200000u);
}

TEST(MediaEnricherTest, NonStandardExceptionIsContained) {
    IntThrowingProbe probe;
    MediaEnricher enricher(probe, true);

    FileRecord record;
    ASSERT_NO_THROW(record = enricher.enrich(video_record(200000)));
    EXPECT_EQ(record.probe_status, ProbeStatus::Failed);
    EXPECT_TRUE(record.is_video);
    EXPECT_FALSE(record.has_video_metadata());
}

TEST(MediaEnricherTest, VideoExtensionsAreCaseInsensitive) {
    EXPECT_TRUE(is_video_extension("/a/b/movie.MKV"));
    EXPECT_TRUE(is_video_extension("clip.3gp"));
    EXPECT_FALSE(is_video_extension("song.mp3"));
    EXPECT_FALSE(is_video_extension("noext"));
}
