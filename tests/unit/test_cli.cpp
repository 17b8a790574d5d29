#include <gtest/gtest.h>
#include <initializer_list>
#include "file_insights/cli.hpp"

using namespace file_insights;

namespace {
    CliParseResult parse(std::initializer_list<const char*> arguments) {
        std::vector<std::string> storage = {"file-insights"};
        storage.insert(storage.end(), arguments.begin(), arguments.end());
        std::vector<char*> argv;
        for (auto& argument : storage) {
            argv.push_back(argument.data());
        }
        return parse_cli(static_cast<int>(argv.size()), argv.data());
    }
}

TEST(CliTest, NoArgumentsShowsHelp) {
    const auto result = parse({});
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.show_help);
}

TEST(CliTest, ScanDefaults) {
    const auto result = parse({"scan"});
    ASSERT_TRUE(result.valid) << result.error_message;
    EXPECT_EQ(result.command, Command::Scan);
    EXPECT_EQ(result.scan.root, ".");
    EXPECT_TRUE(result.scan.recursive);
    EXPECT_FALSE(result.scan.extract_video_metadata);
    EXPECT_EQ(result.scan.probe_timeout.count(), 10000);
    EXPECT_FALSE(result.store.save);
    EXPECT_FALSE(result.output_path.has_value());
}

TEST(CliTest, ScanOptions) {
    const auto result = parse({"scan", "/srv/media", "-o", "out.json", "--no-recursive", "-e", "**/*.tmp",
                               "--exclude", "**/cache/**", "--video-metadata", "--checksums", "--probe-timeout",
                               "2.5", "--db-save", "--db-connection", "files.db", "--rebuild-db", "-v", "--json"});
    ASSERT_TRUE(result.valid) << result.error_message;
    EXPECT_EQ(result.scan.root, "/srv/media");
    EXPECT_EQ(result.output_path, std::optional<std::string>("out.json"));
    EXPECT_FALSE(result.scan.recursive);
    const std::vector<std::string> patterns = {"**/*.tmp", "**/cache/**"};
    EXPECT_EQ(result.scan.exclude_patterns, patterns);
    EXPECT_TRUE(result.scan.extract_video_metadata);
    EXPECT_TRUE(result.scan.compute_checksums);
    EXPECT_EQ(result.scan.probe_timeout.count(), 2500);
    EXPECT_TRUE(result.store.save);
    EXPECT_EQ(result.store.connection, std::optional<std::string>("files.db"));
    EXPECT_TRUE(result.store.rebuild);
    EXPECT_TRUE(result.scan.verbose);
    EXPECT_TRUE(result.json_output);
}

TEST(CliTest, InvalidProbeTimeout) {
    EXPECT_FALSE(parse({"scan", "--probe-timeout", "soon"}).valid);
    EXPECT_FALSE(parse({"scan", "--probe-timeout", "0"}).valid);
    EXPECT_FALSE(parse({"scan", "--probe-timeout"}).valid);
}

TEST(CliTest, ProbeTimeoutIsCapped) {
    EXPECT_FALSE(parse({"scan", "--probe-timeout", "1e300"}).valid);
    EXPECT_FALSE(parse({"scan", "--probe-timeout", "inf"}).valid);
    EXPECT_FALSE(parse({"scan", "--probe-timeout", "86401"}).valid);

    const auto result = parse({"scan", "--probe-timeout", "86400"});
    ASSERT_TRUE(result.valid) << result.error_message;
    EXPECT_EQ(result.scan.probe_timeout.count(), 86400000);
}

TEST(CliTest, DbInsightsOptions) {
    const auto result = parse({"db-insights", "--limit", "25", "--video-only", "-e", "MP4", "--extension", ".mkv"});
    ASSERT_TRUE(result.valid) << result.error_message;
    EXPECT_EQ(result.command, Command::DbInsights);
    EXPECT_EQ(result.query.limit, 25u);
    EXPECT_TRUE(result.query.video_only);
    const std::vector<std::string> extensions = {".mp4", ".mkv"};
    EXPECT_EQ(result.query.extensions, extensions);
}

TEST(CliTest, DbInsightsRejectsBadLimit) {
    EXPECT_FALSE(parse({"db-insights", "--limit", "-5"}).valid);
    EXPECT_FALSE(parse({"db-insights", "--limit", "ten"}).valid);
}

TEST(CliTest, DbClearNeedsConfirmationFlag) {
    const auto unconfirmed = parse({"db-clear"});
    ASSERT_TRUE(unconfirmed.valid);
    EXPECT_FALSE(unconfirmed.confirmed);

    const auto confirmed = parse({"db-clear", "--yes", "--db-connection", "x.db"});
    ASSERT_TRUE(confirmed.valid);
    EXPECT_EQ(confirmed.command, Command::DbClear);
    EXPECT_TRUE(confirmed.confirmed);
    EXPECT_EQ(confirmed.store.connection, std::optional<std::string>("x.db"));
}

TEST(CliTest, UnknownCommandAndOptions) {
    const auto command = parse({"explode"});
    EXPECT_FALSE(command.valid);
    EXPECT_NE(command.error_message.find("explode"), std::string::npos);

    EXPECT_FALSE(parse({"scan", "--bogus"}).valid);
    EXPECT_FALSE(parse({"db-clear", "--checksums"}).valid);
    EXPECT_FALSE(parse({"scan", "a", "b"}).valid);
    EXPECT_FALSE(parse({"db-insights", "stray"}).valid);
}

TEST(CliTest, HelpAnywhere) {
    EXPECT_TRUE(parse({"scan", "--help"}).show_help);
    EXPECT_TRUE(parse({"-h"}).show_help);
}

TEST(CliTest, DoubleDashTreatsRestAsPositional) {
    const auto result = parse({"scan", "--", "-odd-dir-name"});
    ASSERT_TRUE(result.valid) << result.error_message;
    EXPECT_EQ(result.scan.root, "-odd-dir-name");
}
