#include <gtest/gtest.h>
#include "util/patterns.hpp"

using namespace hl::util;

TEST(PatternsTest, StarCrossesDirectories) {
    EXPECT_TRUE(matchesPattern("a/b/c.bin", "*.bin"));
    EXPECT_FALSE(matchesPattern("a/b/c.txt", "*.bin"));
}

TEST(PatternsTest, TrailingSlashMatchesEverythingBelow) {
    EXPECT_TRUE(matchesPattern("logs/2024/x.txt", "logs/"));
    EXPECT_FALSE(matchesPattern("other/logs.txt", "logs/"));
}

TEST(PatternsTest, DefaultIgnoresCoverGitAndCache) {
    const PathFilter filter({}, {});
    EXPECT_FALSE(filter.accepts(".git/config"));
    EXPECT_FALSE(filter.accepts("sub/.git/HEAD"));
    EXPECT_FALSE(filter.accepts(".cache/huggingface/upload/a.txt.metadata"));
    EXPECT_FALSE(filter.accepts("deep/.cache/huggingface/x"));
    EXPECT_TRUE(filter.accepts("model.safetensors"));
    EXPECT_TRUE(filter.accepts(".gitattributes"));
}

TEST(PatternsTest, AllowListRestricts) {
    const PathFilter filter({"*.json", "data/"}, {});
    EXPECT_TRUE(filter.accepts("config.json"));
    EXPECT_TRUE(filter.accepts("data/train/0.parquet"));
    EXPECT_FALSE(filter.accepts("README.md"));
}

TEST(PatternsTest, IgnoreWinsOverAllow) {
    const PathFilter filter({"*.txt"}, {"secret*"});
    EXPECT_TRUE(filter.accepts("notes.txt"));
    EXPECT_FALSE(filter.accepts("secret.txt"));
}

TEST(PatternsTest, DefaultsCanBeDisabled) {
    const PathFilter filter({}, {}, false);
    EXPECT_TRUE(filter.accepts(".git/config"));
    EXPECT_TRUE(filter.ignorePatterns().empty());
}
