#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <string>

namespace peel {

TEST(Sha256Test, KnownVector) {
    const std::string expected =
        "ba7816bf8f01cfea414140de5dae2223"
        "b00361a396177a9cb410ff61f20015ad";

    testutil::MemoryReader reader("abc");
    EXPECT_EQ(Sha256Hex(reader), expected);
}

TEST(Sha256Test, EmptyInput) {
    testutil::MemoryReader reader("");
    EXPECT_EQ(Sha256Hex(reader),
              "e3b0c44298fc1c149afbf4c8996fb924"
              "27ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, FileDigestMatchesReaderDigest) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp / "abc.txt";
    testutil::WriteFile(path, "abc");

    std::string hex;
    auto r = Sha256HexFile(path, hex);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, MissingFileFails) {
    std::string hex;
    EXPECT_FALSE(Sha256HexFile("/nonexistent/peel/file", hex).ok);
    EXPECT_TRUE(hex.empty());
}

} // namespace peel
