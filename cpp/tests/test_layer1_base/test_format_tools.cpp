/**
 * @file test_format_tools.cpp
 * @brief Layer 1 tests for format_tools: filename_only, make_buffer, formatted_time, hex_dump.
 */
#include "fbr_base.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <numeric>
#include <vector>

using namespace filebridge::format_tools;
using namespace ::testing;

// ============================================================================
// filename_only
// ============================================================================

TEST(FormatToolsTest, FilenameOnly_StripsDirectories)
{
    static_assert(filename_only("/a/b/c.cpp") == "c.cpp");
    EXPECT_EQ(filename_only("C:\\src\\transfer\\buffer_pool.cpp"), "buffer_pool.cpp");
    EXPECT_EQ(filename_only("mixed/dir\\file.h"), "file.h");
    EXPECT_EQ(filename_only("plain.txt"), "plain.txt");
    EXPECT_EQ(filename_only("trailing/"), "");
}

// ============================================================================
// make_buffer
// ============================================================================

TEST(FormatToolsTest, MakeBuffer_FormatsArguments)
{
    auto mb = make_buffer("{}:{}", "fileRef", 7);
    EXPECT_EQ(fmt::to_string(mb), "fileRef:7");

    auto rt = make_buffer_rt("{} bytes", 128);
    EXPECT_EQ(fmt::to_string(rt), "128 bytes");
}

// ============================================================================
// formatted_time
// ============================================================================

TEST(FormatToolsTest, FormattedTime_HasMicrosecondField)
{
    const std::string s = formatted_time(std::chrono::system_clock::now());
    // "YYYY-MM-DD HH:MM:SS.uuuuuu"
    ASSERT_EQ(s.size(), 26u) << s;
    EXPECT_EQ(s[4], '-');
    EXPECT_EQ(s[10], ' ');
    EXPECT_EQ(s[19], '.');
}

// ============================================================================
// hex_dump
// ============================================================================

TEST(FormatToolsTest, HexDump_SingleLine)
{
    const std::vector<uint8_t> data = {'f', 'b', 'r', 0x00, 0xff};
    const std::string dump = hex_dump(data);

    EXPECT_THAT(dump, StartsWith("00000000  66 62 72 00 ff "));
    EXPECT_THAT(dump, EndsWith("|fbr..|\n"));
    EXPECT_EQ(std::count(dump.begin(), dump.end(), '\n'), 1);
}

TEST(FormatToolsTest, HexDump_OffsetsAreAbsolute)
{
    std::vector<uint8_t> data(64);
    std::iota(data.begin(), data.end(), uint8_t{0});

    const std::string dump = hex_dump(data, 32, 20);
    EXPECT_THAT(dump, StartsWith("00000020  20 21 22"));
    EXPECT_THAT(dump, HasSubstr("\n00000030  30 31 32 33 "));
    EXPECT_EQ(std::count(dump.begin(), dump.end(), '\n'), 2);
}

TEST(FormatToolsTest, HexDump_IsBoundedByMaxBytes)
{
    std::vector<uint8_t> data(4096, 0xAB);
    const std::string dump = hex_dump(data, 0, 64);
    EXPECT_EQ(std::count(dump.begin(), dump.end(), '\n'), 4);
}

TEST(FormatToolsTest, HexDump_OutOfRangeIsEmpty)
{
    std::vector<uint8_t> data(8, 1);
    EXPECT_TRUE(hex_dump(data, 8).empty());
    EXPECT_TRUE(hex_dump(data, 100).empty());
    EXPECT_TRUE(hex_dump(data, 0, 0).empty());
    EXPECT_TRUE(hex_dump({}, 0).empty());
}
