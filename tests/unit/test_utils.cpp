#include <gtest/gtest.h>
#include "file_insights/utils.hpp"
#include "file_insights/config.hpp"
#include "TestHelpers.hpp"

using namespace file_insights;

TEST(UtilsTest, FormatSize) {
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(1023), "1023 B");
    EXPECT_EQ(format_size(1536), "1.50 KB");
    EXPECT_EQ(format_size(1024ull * 1024 * 1024 * 3), "3.00 GB");
    EXPECT_EQ(format_size(1024ull * 1024 * 1024 * 1024 * 2048), "2048.00 TB");
}

TEST(UtilsTest, LowercaseExtension) {
    EXPECT_EQ(lowercase_extension("/a/B.TXT"), ".txt");
    EXPECT_EQ(lowercase_extension("/a/archive.tar.GZ"), ".gz");
    EXPECT_EQ(lowercase_extension("/a/Makefile"), "");
    EXPECT_EQ(lowercase_extension("/a/.bashrc"), "");
}

TEST(UtilsTest, TimeFormattingRoundTrips) {
    const auto parsed = parse_time("2023-06-15 08:30:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(format_time(*parsed), "2023-06-15 08:30:00");
    EXPECT_EQ(format_date(*parsed), "2023-06-15");
    EXPECT_FALSE(parse_time("yesterday").has_value());
}

TEST(UtilsTest, JsonEscape) {
    EXPECT_EQ(json_escape("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(json_escape("line\nbreak\t"), "line\\nbreak\\t");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(json_escape("caf\xc3\xa9"), "caf\xc3\xa9");
    EXPECT_EQ(json_escape("bad\xff"), "bad\\uDCFF");
}

TEST(UtilsTest, StrayBytesAreReversible) {
    const std::string latin1 = "caf\xe9.txt";
    const std::string escaped = escape_stray_bytes(latin1);
    EXPECT_EQ(escaped, "caf\xed\xb3\xa9.txt");
    EXPECT_EQ(restore_stray_bytes(escaped), latin1);

    EXPECT_EQ(escape_stray_bytes("caf\xc3\xa9"), "caf\xc3\xa9");
    EXPECT_EQ(restore_stray_bytes("caf\xc3\xa9"), "caf\xc3\xa9");

    // An encoded surrogate in the raw name is escaped byte by byte.
    const std::string surrogate = "x\xed\xb3\xa9";
    EXPECT_EQ(restore_stray_bytes(escape_stray_bytes(surrogate)), surrogate);

    const std::string truncated = "end\xc3";
    EXPECT_EQ(restore_stray_bytes(escape_stray_bytes(truncated)), truncated);
}

TEST(ScanConfigValidation, AcceptsReadableDirectory) {
    TempDir temp_dir;
    ScanConfig config;
    config.root = temp_dir.path();
    EXPECT_FALSE(validate_scan_config(config).has_value());
}

TEST(ScanConfigValidation, RejectsBadInput) {
    TempDir temp_dir;
    write_file(temp_dir.path() / "file.txt");

    ScanConfig missing;
    missing.root = temp_dir.path() / "absent";
    EXPECT_TRUE(validate_scan_config(missing).has_value());

    ScanConfig not_directory;
    not_directory.root = temp_dir.path() / "file.txt";
    EXPECT_TRUE(validate_scan_config(not_directory).has_value());

    ScanConfig empty_pattern;
    empty_pattern.root = temp_dir.path();
    empty_pattern.exclude_patterns = {""};
    EXPECT_TRUE(validate_scan_config(empty_pattern).has_value());

    ScanConfig zero_timeout;
    zero_timeout.root = temp_dir.path();
    zero_timeout.extract_video_metadata = true;
    zero_timeout.probe_timeout = std::chrono::milliseconds(0);
    EXPECT_TRUE(validate_scan_config(zero_timeout).has_value());
}
