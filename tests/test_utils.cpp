#include <gtest/gtest.h>
#include <nanoclaw/core/utils.hpp>
#include "test_helpers.hpp"

using namespace nanoclaw;
using namespace nanoclaw::test_support;

TEST(PathUtilsTest, NormalizeResolvesDotSegments) {
    EXPECT_EQ("/a/c", normalize_path("/a/b/../c/./"));
    EXPECT_EQ("/", normalize_path("/.."));
    EXPECT_EQ("../x", normalize_path("../x"));
    EXPECT_EQ("a", normalize_path("a//"));
}

TEST(PathUtilsTest, WithinIsComponentWise) {
    EXPECT_TRUE(path_is_within("/home/u/projects", "/home/u/projects"));
    EXPECT_TRUE(path_is_within("/home/u/projects/x", "/home/u/projects"));
    EXPECT_TRUE(path_is_within("/home/u/projects/x", "/home/u/projects/"));
    EXPECT_FALSE(path_is_within("/home/u/projects-old", "/home/u/projects"));
    EXPECT_FALSE(path_is_within("/home/u", "/home/u/projects"));
    EXPECT_TRUE(path_is_within("/etc", "/"));
}

TEST(PathUtilsTest, WithinNormalizesBeforeComparing) {
    EXPECT_FALSE(path_is_within("/home/u/projects/../.ssh", "/home/u/projects"));
    EXPECT_TRUE(path_is_within("/home/u/projects/../.ssh", "/home/u/.ssh"));
}

TEST(PathUtilsTest, BaseNameAndJoin) {
    EXPECT_EQ("b", base_name("/a/b"));
    EXPECT_EQ("b", base_name("/a/b/"));
    EXPECT_EQ("a/b", join_path("a/", "/b"));
    EXPECT_EQ("a/b", join_path("a", "b"));
}

TEST(PathUtilsTest, ExpandHome) {
    std::string home = home_directory();
    ASSERT_FALSE(home.empty());
    EXPECT_EQ(home, expand_home("~"));
    EXPECT_EQ(join_path(home, "x/y"), expand_home("~/x/y"));
    EXPECT_EQ("/abs/~", expand_home("/abs/~"));
    EXPECT_EQ("~user/x", expand_home("~user/x"));
}

TEST(PathUtilsTest, EnsureDirectoryIsIdempotent) {
    TempDir tmp;
    std::string deep = tmp.sub("a/b/c");
    EXPECT_TRUE(ensure_directory(deep));
    EXPECT_TRUE(is_directory(deep));
    EXPECT_TRUE(ensure_directory(deep));
}

TEST(PathUtilsTest, EnsureDirectoryFailsThroughAFile) {
    TempDir tmp;
    write_text(tmp.sub("blocker"), "x");
    EXPECT_FALSE(ensure_directory(tmp.sub("blocker/child")));
}

TEST(FileUtilsTest, AtomicWriteReplacesContent) {
    TempDir tmp;
    std::string path = tmp.sub("state.json");
    ASSERT_TRUE(write_file_atomic(path, "first"));
    ASSERT_TRUE(write_file_atomic(path, "second"));

    std::string content;
    ASSERT_TRUE(read_file(path, content));
    EXPECT_EQ("second", content);
    // No temp files left behind
    EXPECT_EQ(std::vector<std::string>(1, "state.json"), list_files(tmp.path()));
}

TEST(StringUtilsTest, TailSafeKeepsCharacterBoundaries) {
    EXPECT_EQ("abc", tail_safe("abc", 10));
    EXPECT_EQ("bc", tail_safe("abc", 2));
    // "é" is two bytes; a cut through it drops the orphaned continuation byte
    std::string s = "x\xC3\xA9yz";
    EXPECT_EQ("yz", tail_safe(s, 3));
    EXPECT_EQ("\xC3\xA9yz", tail_safe(s, 4));
}

TEST(StringUtilsTest, TruncateSafeKeepsCharacterBoundaries) {
    std::string s = "ab\xC3\xA9";
    EXPECT_EQ("ab", truncate_safe(s, 3));
    EXPECT_EQ(s, truncate_safe(s, 4));
}

TEST(StringUtilsTest, SplitTrimJoin) {
    std::vector<std::string> parts = split("a,b,,c", ',');
    ASSERT_EQ(4u, parts.size());
    EXPECT_EQ("", parts[2]);
    EXPECT_EQ("a-b--c", join(parts, "-"));
    EXPECT_EQ("x y", trim("  x y\r\n"));
    EXPECT_TRUE(starts_with("ANTHROPIC_API_KEY=1", "ANTHROPIC_API_KEY="));
    EXPECT_EQ("abc", to_lower("AbC"));
}

TEST(TimeUtilsTest, TimestampFormats) {
    // 2024-01-02T03:04:05.678Z
    int64_t ms = 1704164645678LL;
    EXPECT_EQ("2024-01-02T03:04:05.678Z", format_timestamp_utc(ms));
    EXPECT_EQ("2024-01-02T03-04-05-678Z", file_timestamp(ms));

    std::string local = format_timestamp_local(ms);
    ASSERT_EQ(29u, local.size());
    EXPECT_TRUE(local[23] == '+' || local[23] == '-');
    EXPECT_EQ(':', local[26]);
}

TEST(UuidTest, UniqueV4) {
    std::string a = generate_uuid();
    std::string b = generate_uuid();
    EXPECT_EQ(36u, a.size());
    EXPECT_EQ('4', a[14]);
    EXPECT_NE(a, b);
}
