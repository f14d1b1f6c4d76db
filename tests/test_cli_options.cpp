/// @file test_cli_options.cpp
/// @brief Tests for command-line parsing and the help text

#include "cli_options.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using procpeek::Command;
using procpeek::parse_command_line;
using procpeek::SortKey;
using procpeek::UsageError;

using Args = std::vector<std::string>;

// =============================================================================
// Commands
// =============================================================================

TEST(CliOptionsTest, NoArgumentsLaunchesInteractiveMode)
{
    const auto cmd = parse_command_line({});
    EXPECT_EQ(cmd.command, Command::Interactive);
    EXPECT_FALSE(cmd.refresh_interval_ms.has_value());
    EXPECT_FALSE(cmd.sample_timeout_ms.has_value());
}

TEST(CliOptionsTest, ListDefaultsToCpuAndTen)
{
    const auto cmd = parse_command_line({"list"});
    EXPECT_EQ(cmd.command, Command::List);
    EXPECT_EQ(cmd.sort_key, SortKey::Cpu);
    EXPECT_EQ(cmd.count, 10);
}

TEST(CliOptionsTest, HelpAndVersionFlags)
{
    EXPECT_EQ(parse_command_line({"--help"}).command, Command::Help);
    EXPECT_EQ(parse_command_line({"-h"}).command, Command::Help);
    EXPECT_EQ(parse_command_line({"list", "--help"}).command, Command::Help);
    EXPECT_EQ(parse_command_line({"--version"}).command, Command::Version);
    EXPECT_EQ(parse_command_line({"-V"}).command, Command::Version);
}

// =============================================================================
// list options
// =============================================================================

TEST(CliOptionsTest, LongListOptions)
{
    const auto cmd = parse_command_line({"list", "--sort", "memory", "--count", "15"});
    EXPECT_EQ(cmd.sort_key, SortKey::Memory);
    EXPECT_EQ(cmd.count, 15);
}

TEST(CliOptionsTest, ShortListOptions)
{
    const auto cmd = parse_command_line({"list", "-s", "name", "-n", "5"});
    EXPECT_EQ(cmd.sort_key, SortKey::Name);
    EXPECT_EQ(cmd.count, 5);
}

TEST(CliOptionsTest, InlineValues)
{
    const auto cmd = parse_command_line({"list", "--sort=pid", "--count=3"});
    EXPECT_EQ(cmd.sort_key, SortKey::Pid);
    EXPECT_EQ(cmd.count, 3);
}

TEST(CliOptionsTest, UnknownSortKeyIsUsageError)
{
    EXPECT_THROW(parse_command_line({"list", "--sort", "size"}), UsageError);
    EXPECT_THROW(parse_command_line({"list", "--sort="}), UsageError);
}

TEST(CliOptionsTest, NonPositiveCountIsUsageError)
{
    for (const char* bad : {"0", "-1", "-20", "abc", "1.5", "", "7x"})
    {
        EXPECT_THROW(parse_command_line({"list", "--count", bad}), UsageError) << "count=" << bad;
    }
}

TEST(CliOptionsTest, MissingValueIsUsageError)
{
    EXPECT_THROW(parse_command_line({"list", "--count"}), UsageError);
    EXPECT_THROW(parse_command_line({"list", "-s"}), UsageError);
    EXPECT_THROW(parse_command_line({"--log-file"}), UsageError);
}

TEST(CliOptionsTest, ListOptionsRequireListSubcommand)
{
    EXPECT_THROW(parse_command_line({"--sort", "cpu"}), UsageError);
    EXPECT_THROW(parse_command_line({"-n", "5"}), UsageError);
}

// =============================================================================
// Interactive options
// =============================================================================

TEST(CliOptionsTest, IntervalAndTimeoutAreSeconds)
{
    const auto cmd = parse_command_line({"--interval", "0.5", "--timeout=2"});
    EXPECT_EQ(cmd.command, Command::Interactive);
    ASSERT_TRUE(cmd.refresh_interval_ms.has_value());
    EXPECT_EQ(*cmd.refresh_interval_ms, 500);
    ASSERT_TRUE(cmd.sample_timeout_ms.has_value());
    EXPECT_EQ(*cmd.sample_timeout_ms, 2000);
}

TEST(CliOptionsTest, BadIntervalIsUsageError)
{
    EXPECT_THROW(parse_command_line({"--interval", "fast"}), UsageError);
    EXPECT_THROW(parse_command_line({"--interval", "0"}), UsageError);
    EXPECT_THROW(parse_command_line({"--interval", "-1"}), UsageError);
}

TEST(CliOptionsTest, IntervalDoesNotApplyToList)
{
    EXPECT_THROW(parse_command_line({"list", "--interval", "1"}), UsageError);
    EXPECT_THROW(parse_command_line({"--interval", "1", "list"}), UsageError);
}

TEST(CliOptionsTest, LoggingOptionsWorkInBothModes)
{
    const auto interactive = parse_command_line({"--log-file", "/tmp/pp.log", "--log-level=debug"});
    EXPECT_EQ(interactive.log_file, "/tmp/pp.log");
    EXPECT_EQ(interactive.log_level, "debug");

    const auto list = parse_command_line({"list", "--log-level", "info"});
    EXPECT_EQ(list.command, Command::List);
    EXPECT_EQ(list.log_level, "info");
}

TEST(CliOptionsTest, UnknownArgumentsAreUsageErrors)
{
    EXPECT_THROW(parse_command_line({"--frobnicate"}), UsageError);
    EXPECT_THROW(parse_command_line({"top"}), UsageError);
    EXPECT_THROW(parse_command_line({"list", "list"}), UsageError);
}

// =============================================================================
// Help text
// =============================================================================

TEST(CliOptionsTest, UsageTextDescribesTool)
{
    const std::string text = procpeek::usage_text();
    EXPECT_NE(text.find("proc-peek"), std::string::npos);
    EXPECT_NE(text.find("mini process monitor"), std::string::npos);
    EXPECT_NE(text.find("--sort"), std::string::npos);
    EXPECT_NE(text.find("--count"), std::string::npos);
}

TEST(CliOptionsTest, VersionTextNamesTool)
{
    EXPECT_EQ(procpeek::version_text().rfind("proc-peek ", 0), 0u);
}
