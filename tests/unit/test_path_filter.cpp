#include <gtest/gtest.h>
#include "file_insights/config.hpp"
#include "file_insights/path_filter.hpp"

using namespace file_insights;

TEST(PathFilterTest, DoubleStarCrossesSeparators) {
    EXPECT_TRUE(matches_pattern("/data/project/.env", "**/.*"));
    EXPECT_TRUE(matches_pattern("/data/a/b/c/module.pyc", "**/*.pyc"));
    EXPECT_TRUE(matches_pattern("/data/web/node_modules/pkg/index.js", "**/node_modules/**"));
}

TEST(PathFilterTest, DirectoryPatternNeedsTrailingComponent) {
    // The directory itself has nothing after the separator.
    EXPECT_FALSE(matches_pattern("/data/web/node_modules", "**/node_modules/**"));
    EXPECT_TRUE(matches_pattern("/data/web/node_modules/x", "**/node_modules/**"));
}

TEST(PathFilterTest, BackslashIsLiteral) {
    EXPECT_TRUE(matches_pattern("dir\\file.txt", "dir\\file.txt"));
    EXPECT_FALSE(matches_pattern("dirfile.txt", "dir\\file.txt"));
}

TEST(PathFilterTest, CharacterClasses) {
    EXPECT_TRUE(matches_pattern("/logs/app1.log", "*/app[0-9].log"));
    EXPECT_FALSE(matches_pattern("/logs/appx.log", "*/app[0-9].log"));
    EXPECT_TRUE(matches_pattern("/logs/a.tmp", "*.tm?"));
}

TEST(PathFilterTest, ShouldExcludeMatchesAnyPattern) {
    const std::vector<std::string> patterns = {"**/*.bak", "**/cache/**"};
    EXPECT_TRUE(should_exclude("/root/notes.bak", patterns));
    EXPECT_TRUE(should_exclude("/root/cache/entry", patterns));
    EXPECT_FALSE(should_exclude("/root/notes.txt", patterns));
    EXPECT_FALSE(should_exclude("/root/notes.txt", {}));
}

TEST(PathFilterTest, DefaultPatternsHideDotFilesAndToolDirectories) {
    const auto& patterns = default_exclude_patterns();
    EXPECT_TRUE(should_exclude("/repo/.gitignore", patterns));
    EXPECT_TRUE(should_exclude("/repo/.git/config", patterns));
    EXPECT_TRUE(should_exclude("/repo/pkg/__pycache__/mod.cpython-311.pyc", patterns));
    EXPECT_TRUE(should_exclude("/repo/venv/bin/python", patterns));
    EXPECT_FALSE(should_exclude("/repo/src/main.py", patterns));
}

TEST(PathFilterTest, CallerPatternsReplaceDefaults) {
    ScanConfig config;
    EXPECT_EQ(&effective_exclude_patterns(config), &default_exclude_patterns());

    config.exclude_patterns = {"**/*.log"};
    const auto& patterns = effective_exclude_patterns(config);
    ASSERT_EQ(patterns.size(), 1u);
    EXPECT_FALSE(should_exclude("/repo/.hidden", patterns));
    EXPECT_TRUE(should_exclude("/repo/build.log", patterns));
}
