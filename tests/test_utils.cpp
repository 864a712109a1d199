#include <gtest/gtest.h>

#include "capsule/utils/hash_utils.hpp"
#include "capsule/utils/string_utils.hpp"

#include <set>

using capsule::utils::HashUtils;
using capsule::utils::StringUtils;

TEST(StringUtilsTest, TrimAndLower) {
    EXPECT_EQ(StringUtils::Trim("  Isolated \n"), "Isolated");
    EXPECT_EQ(StringUtils::Trim(" \t "), "");
    EXPECT_EQ(StringUtils::ToLower("InProcess"), "inprocess");
}

TEST(StringUtilsTest, SplitDropsEmptyTokens) {
    auto parts = StringUtils::Split("/usr/bin::/bin:", ':');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "/usr/bin");
    EXPECT_EQ(parts[1], "/bin");
}

TEST(StringUtilsTest, JoinUsesDelimiter) {
    EXPECT_EQ(StringUtils::Join({"a", "b", "c"}, "; "), "a; b; c");
    EXPECT_EQ(StringUtils::Join({}, "; "), "");
}

TEST(StringUtilsTest, TruncateKeepsUtf8Intact) {
    EXPECT_EQ(StringUtils::Truncate("short", 10), "short");
    EXPECT_EQ(StringUtils::Truncate("abcdef", 3), "abc...");
    EXPECT_EQ(StringUtils::Truncate("h\xC3\xA9llo", 2), "h...");
    EXPECT_EQ(StringUtils::Truncate("abcdef", 3, ""), "abc");
}

TEST(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(StringUtils::StartsWith("NameError: x", "NameError"));
    EXPECT_FALSE(StringUtils::StartsWith("Name", "NameError"));
}

TEST(HashUtilsTest, Sha256MatchesKnownDigest) {
    EXPECT_EQ(HashUtils::ComputeSHA256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(HashUtils::ComputeSHA256(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashUtilsTest, UuidsAreVersionFourAndUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto id = HashUtils::GenerateUuid();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST(HashUtilsTest, ToHexIsLowercase) {
    const unsigned char bytes[] = {0x00, 0xAB, 0x7F};
    EXPECT_EQ(HashUtils::ToHex(bytes, sizeof(bytes)), "00ab7f");
}
