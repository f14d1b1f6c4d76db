/// @file test_format_utils.cpp
/// @brief Tests for byte, uptime and truncation formatting

#include "format_utils.hpp"

#include <gtest/gtest.h>

TEST(FormatUtilsTest, FormatBytes)
{
    EXPECT_EQ(procpeek::format_bytes(0), "0B");
    EXPECT_EQ(procpeek::format_bytes(512), "512B");
    EXPECT_EQ(procpeek::format_bytes(1536), "1.50K");
    EXPECT_EQ(procpeek::format_bytes(10LL * 1024 * 1024), "10.0M");
    EXPECT_EQ(procpeek::format_bytes(200LL * 1024 * 1024 * 1024), "200G");
}

TEST(FormatUtilsTest, FormatUptime)
{
    EXPECT_EQ(procpeek::format_uptime(0), "00:00:00");
    EXPECT_EQ(procpeek::format_uptime(59), "00:00:59");
    EXPECT_EQ(procpeek::format_uptime(3661), "01:01:01");
    EXPECT_EQ(procpeek::format_uptime(90061), "1d 01:01:01");
    EXPECT_EQ(procpeek::format_uptime(-5), "00:00:00");
}

TEST(FormatUtilsTest, TruncateTo)
{
    EXPECT_EQ(procpeek::truncate_to("short", 10), "short");
    EXPECT_EQ(procpeek::truncate_to("exactly", 7), "exactly");
    EXPECT_EQ(procpeek::truncate_to("truncated", 5), "trun~");
    EXPECT_EQ(procpeek::truncate_to("anything", 0), "");
}

TEST(FormatUtilsTest, FormatTimeLayout)
{
    const auto text = procpeek::format_time(std::chrono::system_clock::now());
    ASSERT_EQ(text.size(), 19u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], ' ');
    EXPECT_EQ(text[13], ':');
}
