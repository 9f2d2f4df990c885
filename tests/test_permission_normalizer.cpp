#include <gtest/gtest.h>

#include "peel/permission_normalizer.hpp"
#include "testing.hpp"

#include <sys/stat.h>
#include <unistd.h>

namespace {

mode_t ModeOf(const std::string& path) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0)
        return 0;
    return st.st_mode & 07777;
}

TEST(PermissionNormalizerTests, WidensLockedTree) {
    testutil::TemporaryDirectory tmp;
    const std::string root = tmp / "out";
    ASSERT_EQ(::mkdir(root.c_str(), 0755), 0);
    ASSERT_EQ(::mkdir((root + "/locked").c_str(), 0755), 0);
    testutil::WriteFile(root + "/locked/secret.txt", "s");
    testutil::WriteFile(root + "/top.txt", "t");

    ASSERT_EQ(::chmod((root + "/locked/secret.txt").c_str(), 0000), 0);
    ASSERT_EQ(::chmod((root + "/top.txt").c_str(), 0044), 0);
    ASSERT_EQ(::chmod((root + "/locked").c_str(), 0000), 0);
    ASSERT_EQ(::chmod(root.c_str(), 0100), 0);

    peel::PermissionNormalizer normalizer;
    const auto warnings = normalizer.Normalize(root);
    EXPECT_TRUE(warnings.empty());

    EXPECT_EQ(ModeOf(root) & S_IRWXU, S_IRWXU);
    EXPECT_EQ(ModeOf(root + "/locked") & S_IRWXU, S_IRWXU);
    EXPECT_EQ(ModeOf(root + "/locked/secret.txt"), static_cast<mode_t>(S_IRUSR | S_IWUSR));
    EXPECT_EQ(ModeOf(root + "/top.txt"), static_cast<mode_t>(0644));
}

TEST(PermissionNormalizerTests, LeavesExistingBitsAndSymlinks) {
    testutil::TemporaryDirectory tmp;
    const std::string root = tmp / "out";
    ASSERT_EQ(::mkdir(root.c_str(), 0755), 0);
    testutil::WriteFile(root + "/run.sh", "#!/bin/sh\n");
    ASSERT_EQ(::chmod((root + "/run.sh").c_str(), 0755), 0);
    ASSERT_EQ(::symlink("/nonexistent/target", (root + "/dangling").c_str()), 0);

    peel::PermissionNormalizer normalizer;
    EXPECT_TRUE(normalizer.Normalize(root).empty());
    EXPECT_EQ(ModeOf(root + "/run.sh"), static_cast<mode_t>(0755));
    EXPECT_TRUE(testutil::Exists(root + "/dangling"));
}

TEST(PermissionNormalizerTests, SingleFileRoot) {
    testutil::TemporaryDirectory tmp;
    const std::string file = tmp / "notes.txt";
    testutil::WriteFile(file, "n");
    ASSERT_EQ(::chmod(file.c_str(), 0000), 0);

    peel::PermissionNormalizer normalizer;
    EXPECT_TRUE(normalizer.Normalize(file).empty());
    EXPECT_EQ(ModeOf(file), static_cast<mode_t>(S_IRUSR | S_IWUSR));
}

TEST(PermissionNormalizerTests, MissingRootIsReported) {
    testutil::TemporaryDirectory tmp;
    peel::PermissionNormalizer normalizer;
    const auto warnings = normalizer.Normalize(tmp / "absent");
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings.front().find("absent"), std::string::npos);
}

} // namespace
