#include <gtest/gtest.h>
#include <json/json.h>
#include "file_insights/utils.hpp"
#include "file_insights/report.hpp"
#include "file_insights/aggregator.hpp"
#include "TestHelpers.hpp"

using namespace file_insights;
using namespace std::chrono_literals;

namespace {
    std::vector<FileRecord> sample_records(TimePoint now) {
        auto text = make_record("/lib/docs/\"quoted\".txt", 120, now - 48h);
        auto plain = make_record("/lib/noext", 8, now - 24h * 500);
        auto movie = make_record("/lib/media/movie.mkv", 900000, now - 2h);
        movie.is_video = true;
        movie.video.duration = 95.5;
        movie.video.resolution = Resolution {3840, 2160};
        movie.video.fps = 23.976;
        movie.video.video_codec = "hevc";
        auto clip = make_record("/lib/media/clip.mp4", 40000, now - 3h);
        clip.is_video = true;
        clip.video.duration = 4.0;
        text.checksum = std::string("deadbeef");
        plain.checksum = std::string("deadbeef");
        return {text, plain, movie, clip};
    }

    Json::Value parse(const std::string& text) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string errors;
        EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;
        return root;
    }
}

TEST(ReportTest, JsonLayout) {
    const TimePoint now = Clock::now();
    const auto result = aggregate(sample_records(now), now);
    const Json::Value root = parse(report_to_json(result));

    EXPECT_EQ(root["generated_at"].asString(), format_time(now));
    EXPECT_EQ(root["general_stats"]["total_files"].asUInt(), 4u);
    EXPECT_EQ(root["general_stats"]["total_directories"].asUInt(), 3u);
    ASSERT_TRUE(root["file_types"].isArray());
    EXPECT_EQ(root["file_types"][0]["extension"].asString(), ".mkv");
    EXPECT_TRUE(root["age_distribution"].isMember("Older"));

    const Json::Value& lib = root["file_tree"]["lib"];
    EXPECT_EQ(lib["type"].asString(), "directory");
    const Json::Value& movie = lib["children"]["media"]["children"]["movie.mkv"];
    EXPECT_EQ(movie["type"].asString(), "file");
    EXPECT_EQ(movie["video"]["resolution"].asString(), "3840x2160");
    EXPECT_TRUE(movie["video"]["audio_codec"].isNull());
    EXPECT_TRUE(lib["children"]["docs"]["children"].isMember("\"quoted\".txt"));

    const Json::Value& codecs = root["video_stats"]["codec_counts"];
    ASSERT_EQ(codecs.size(), 2u);
    EXPECT_EQ(codecs[0]["codec"].asString(), "hevc");
    EXPECT_TRUE(codecs[1]["codec"].isNull());

    ASSERT_EQ(root["duplicates"].size(), 1u);
    EXPECT_EQ(root["duplicates"][0]["wasted_bytes"].asUInt64(), 120u);
}

TEST(ReportTest, OptionalSectionsAreOmitted) {
    const TimePoint now = Clock::now();
    const auto result = aggregate({make_record("/a/b.txt", 1, now)}, now);
    const Json::Value root = parse(report_to_json(result));
    EXPECT_FALSE(root.isMember("video_stats"));
    EXPECT_FALSE(root.isMember("duplicates"));
}

TEST(ReportTest, SavedReportLoadsBack) {
    TempDir temp_dir;
    const TimePoint now = Clock::now();
    const auto original = aggregate(sample_records(now), now);
    const auto output = temp_dir.path() / "insights.json";

    ASSERT_FALSE(save_report(original, output).has_value());

    std::string error;
    const auto loaded = load_report(output, error);
    ASSERT_TRUE(loaded.has_value()) << error;

    EXPECT_EQ(format_time(loaded->generated_at), format_time(original.generated_at));
    EXPECT_EQ(loaded->general.total_files, original.general.total_files);
    EXPECT_EQ(loaded->general.total_size, original.general.total_size);
    EXPECT_DOUBLE_EQ(loaded->general.average_size, original.general.average_size);
    EXPECT_EQ(loaded->general.oldest_file, original.general.oldest_file);

    ASSERT_EQ(loaded->file_types.size(), original.file_types.size());
    for (std::size_t i = 0; i < original.file_types.size(); ++i) {
        EXPECT_EQ(loaded->file_types[i].extension, original.file_types[i].extension);
        EXPECT_NEAR(loaded->file_types[i].percentage, original.file_types[i].percentage, 1e-9);
    }

    ASSERT_EQ(loaded->age_distribution.size(), original.age_distribution.size());
    for (std::size_t i = 0; i < original.age_distribution.size(); ++i) {
        EXPECT_EQ(loaded->age_distribution[i].label, original.age_distribution[i].label);
        EXPECT_EQ(loaded->age_distribution[i].count, original.age_distribution[i].count);
    }

    const auto* lib = find_child(loaded->file_tree, "lib");
    ASSERT_NE(lib, nullptr);
    const auto* media = find_child(std::get<FileTreeDirectory>(lib->node), "media");
    ASSERT_NE(media, nullptr);
    const auto* movie = find_child(std::get<FileTreeDirectory>(media->node), "movie.mkv");
    ASSERT_NE(movie, nullptr);
    const auto& leaf = std::get<FileTreeLeaf>(movie->node);
    ASSERT_TRUE(leaf.video.has_value());
    ASSERT_TRUE(leaf.video->resolution.has_value());
    EXPECT_EQ(leaf.video->resolution->width, 3840);
    EXPECT_DOUBLE_EQ(*leaf.video->fps, 23.976);

    ASSERT_TRUE(loaded->video_stats.has_value());
    EXPECT_EQ(loaded->video_stats->codec_counts.size(), 2u);
    ASSERT_TRUE(loaded->duplicates.has_value());
    EXPECT_EQ(loaded->duplicates->front().paths.size(), 2u);
}

TEST(ReportTest, MalformedJsonIsRejected) {
    std::string error;
    EXPECT_FALSE(report_from_json("{not json", error).has_value());
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(report_from_json("{\"file_tree\": {}}", error).has_value());
    EXPECT_NE(error.find("general_stats"), std::string::npos);
}

TEST(ReportTest, UnwritableOutputReportsError) {
    TempDir temp_dir;
    const auto result = aggregate({}, Clock::now());
    const auto error = save_report(result, temp_dir.path() / "missing-dir" / "out.json");
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->find("out.json"), std::string::npos);
}

TEST(ReportTest, NonUtf8NamesSurviveRoundTrip) {
    const TimePoint now = Clock::now();
    const std::string latin1 = "caf\xe9.txt";
    const auto original = aggregate({make_record("/d/" + latin1, 10, now), make_record("/d/plain.txt", 5, now)}, now);

    const std::string json = report_to_json(original);
    EXPECT_NE(json.find("caf\\udce9.txt"), std::string::npos);
    EXPECT_EQ(json.find('\xe9'), std::string::npos);

    std::string error;
    const auto loaded = report_from_json(json, error);
    ASSERT_TRUE(loaded.has_value()) << error;

    const auto* d = find_child(loaded->file_tree, "d");
    ASSERT_NE(d, nullptr);
    const auto& directory = std::get<FileTreeDirectory>(d->node);
    ASSERT_EQ(directory.children.size(), 2u);
    EXPECT_NE(find_child(directory, latin1), nullptr);
    EXPECT_NE(find_child(directory, "plain.txt"), nullptr);
    EXPECT_EQ(loaded->general.oldest_file, original.general.oldest_file);
}
