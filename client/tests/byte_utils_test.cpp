#include <gtest/gtest.h>

#include "util/byte_utils.hpp"

TEST(ByteUtilsTest, FormatsHumanReadableSizes) {
    EXPECT_EQ(byte_utils::format_bytes(0), "0 B");
    EXPECT_EQ(byte_utils::format_bytes(512), "512 B");
    EXPECT_EQ(byte_utils::format_bytes(1536), "1.50 KB");
    EXPECT_EQ(byte_utils::format_bytes(1000000), "977 KB");
    EXPECT_EQ(byte_utils::format_bytes(1048576), "1.00 MB");
    EXPECT_EQ(byte_utils::format_bytes(50ULL * 1048576), "50.0 MB");
}

TEST(ByteUtilsTest, FormatsRate) {
    EXPECT_EQ(byte_utils::format_rate(0.0), "0 B/s");
    EXPECT_EQ(byte_utils::format_rate(2048.0), "2.00 KB/s");
}

TEST(ByteUtilsTest, ParsesSizes) {
    EXPECT_EQ(byte_utils::parse_size("1048576"), 1048576u);
    EXPECT_EQ(byte_utils::parse_size("512K"), 512u * 1024u);
    EXPECT_EQ(byte_utils::parse_size("4MB"), 4u * 1048576u);
    EXPECT_EQ(byte_utils::parse_size("4mb"), 4u * 1048576u);
    EXPECT_EQ(byte_utils::parse_size("1 GiB"), 1073741824ULL);
    EXPECT_EQ(byte_utils::parse_size("10B"), 10u);
}

TEST(ByteUtilsTest, RejectsInvalidSizes) {
    EXPECT_FALSE(byte_utils::parse_size("").has_value());
    EXPECT_FALSE(byte_utils::parse_size("MB").has_value());
    EXPECT_FALSE(byte_utils::parse_size("-4").has_value());
    EXPECT_FALSE(byte_utils::parse_size("4XB").has_value());
    EXPECT_FALSE(byte_utils::parse_size("99999999999999999999").has_value());
}
