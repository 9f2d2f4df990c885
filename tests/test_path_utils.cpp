#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, IsUrl) {
    EXPECT_TRUE(peel::IsUrl("http://example.com/a.tar.gz"));
    EXPECT_TRUE(peel::IsUrl("HTTPS://example.com/a.zip"));
    EXPECT_TRUE(peel::IsUrl("ftp://mirror/pub/x.tar.xz"));
    EXPECT_FALSE(peel::IsUrl("file.tar.gz"));
    EXPECT_FALSE(peel::IsUrl("/tmp/http://x"));
}

TEST(PathUtilsTest, UrlBasenameDropsQueryAndFragment) {
    EXPECT_EQ(peel::UrlBasename("https://example.com/dl/pkg-1.0.tar.gz?token=abc#frag"),
              "pkg-1.0.tar.gz");
    EXPECT_EQ(peel::UrlBasename("http://example.com/file.zip"), "file.zip");
    EXPECT_EQ(peel::UrlBasename("http://example.com/dir/"), "");
    EXPECT_EQ(peel::UrlBasename("http://example.com"), "");
}

TEST(PathUtilsTest, SuffixHelpers) {
    EXPECT_TRUE(peel::EndsWith("a.tar.gz", ".gz"));
    EXPECT_FALSE(peel::EndsWith("gz", ".tar.gz"));
    EXPECT_TRUE(peel::StartsWith("inside", "ins"));
    EXPECT_EQ(peel::ToLower("ReadMe.TXT"), "readme.txt");
}

TEST(PathUtilsTest, IsWithinIsLexical) {
    EXPECT_TRUE(peel::IsWithin("/out/pkg", "/out/pkg/a/b"));
    EXPECT_TRUE(peel::IsWithin("/out/pkg/", "/out/pkg/a"));
    EXPECT_TRUE(peel::IsWithin("/out/pkg", "/out/pkg"));
    EXPECT_FALSE(peel::IsWithin("/out/pkg", "/out/pkg2"));
    EXPECT_FALSE(peel::IsWithin("/out/pkg", "/out/pkg/../other"));
}
