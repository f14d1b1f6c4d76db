/// @file test_listing.cpp
/// @brief Tests for one-shot listing mode output

#include "listing.hpp"
#include "cli_options.hpp"
#include "mock_providers.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using TestMocks::makeCounters;
using TestMocks::makeRecord;
using TestMocks::MockProcessSource;
using TestMocks::MockSystemProvider;

namespace
{

std::vector<std::string> splitLines(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        lines.push_back(line);
    }
    return lines;
}

// Table rows: the lines between the rule and an optional trailing note
std::vector<std::string> tableRows(const std::string& text)
{
    const auto lines = splitLines(text);
    std::vector<std::string> rows;
    bool afterRule = false;
    for (const auto& line : lines)
    {
        if (!afterRule)
        {
            afterRule = !line.empty() && line.find_first_not_of('-') == std::string::npos;
            continue;
        }
        if (line.starts_with("("))
        {
            break;
        }
        rows.push_back(line);
    }
    return rows;
}

int leadingPid(const std::string& row)
{
    return std::stoi(row);
}

// 20 records; memory repeats every 4 PIDs so ties exist
procpeek::Snapshot twentyRecords()
{
    procpeek::Snapshot snap;
    for (int i = 0; i < 20; ++i)
    {
        const int pid = 100 + i;
        snap.processes.push_back(makeRecord(pid, "proc" + std::to_string(i), i * 0.5, (i % 5) * 1024 * 1024));
    }
    snap.sequence = 1;
    return snap;
}

} // namespace

TEST(ListingTest, SortMemoryCountFifteenPrintsFifteenRowsInOrder)
{
    const auto cmd = procpeek::parse_command_line({"list", "--sort", "memory", "--count", "15"});

    procpeek::ListingOptions options;
    options.sort_key = cmd.sort_key;
    options.count = static_cast<size_t>(cmd.count);

    std::ostringstream out;
    procpeek::print_listing(out, twentyRecords(), options);

    const auto rows = tableRows(out.str());
    ASSERT_EQ(rows.size(), 15u);

    // Memory groups: i%5 == 4 largest. PIDs with i%5==4 are 104,109,114,119 and so on.
    const std::vector<int> expected = {104, 109, 114, 119, 103, 108, 113, 118, 102, 107, 112, 117, 101, 106, 111};
    std::vector<int> actual;
    for (const auto& row : rows)
    {
        actual.push_back(leadingPid(row));
    }
    EXPECT_EQ(actual, expected);
}

TEST(ListingTest, TitleAndHeader)
{
    procpeek::ListingOptions options;
    options.sort_key = procpeek::SortKey::Name;
    options.count = 5;

    std::ostringstream out;
    procpeek::print_listing(out, twentyRecords(), options);
    const std::string text = out.str();

    EXPECT_NE(text.find("Top 5 processes sorted by name"), std::string::npos);
    for (const char* column : {"PID", "CPU%", "MEM%", "MEMORY", "NAME"})
    {
        EXPECT_NE(text.find(column), std::string::npos) << column;
    }
    EXPECT_EQ(tableRows(text).size(), 5u);
}

TEST(ListingTest, CountLargerThanSnapshotPrintsEverything)
{
    procpeek::ListingOptions options;
    options.count = 50;

    std::ostringstream out;
    procpeek::print_listing(out, twentyRecords(), options);
    EXPECT_EQ(tableRows(out.str()).size(), 20u);
}

TEST(ListingTest, ZeroOrNegativeCountIsRejectedBeforeAnyOutput)
{
    EXPECT_THROW(procpeek::parse_command_line({"list", "--count", "0"}), procpeek::UsageError);
    EXPECT_THROW(procpeek::parse_command_line({"list", "--count", "-3"}), procpeek::UsageError);
}

TEST(ListingTest, OmittedProcessesAreNoted)
{
    auto snap = twentyRecords();
    snap.omitted_count = 2;

    std::ostringstream out;
    procpeek::print_listing(out, snap, {});
    EXPECT_NE(out.str().find("(2 processes could not be read and were omitted)"), std::string::npos);
}

TEST(ListingTest, ColorOnlyWhenRequested)
{
    procpeek::ListingOptions plain;
    std::ostringstream plainOut;
    procpeek::print_listing(plainOut, twentyRecords(), plain);
    EXPECT_EQ(plainOut.str().find('\033'), std::string::npos);

    procpeek::ListingOptions bold;
    bold.use_color = true;
    std::ostringstream boldOut;
    procpeek::print_listing(boldOut, twentyRecords(), bold);
    EXPECT_NE(boldOut.str().find("\033[1m"), std::string::npos);
}

TEST(ListingTest, RunListingSamplesAndPrints)
{
    MockProcessSource source;
    MockSystemProvider system;
    source.setProcesses({makeCounters(1, "init", 0, 0, 4096), makeCounters(2, "shell", 0, 0, 8192),
                         makeCounters(3, "locked", 0, 0, 65536)});
    source.denyAccess(3);

    procpeek::Sampler sampler(&source, &system);
    procpeek::ListingOptions options;
    options.sort_key = procpeek::SortKey::Memory;
    options.cpu_window = std::chrono::milliseconds(0);

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(procpeek::run_listing(sampler, options, out, err), 0);
    EXPECT_TRUE(err.str().empty());

    const auto rows = tableRows(out.str());
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(leadingPid(rows[0]), 2);
    EXPECT_NE(rows[0].find("shell"), std::string::npos);
    EXPECT_NE(out.str().find("(1 process could not be read and was omitted)"), std::string::npos);
}

TEST(ListingTest, RunListingReportsSamplingFailure)
{
    MockProcessSource source;
    MockSystemProvider system;
    source.setListingFails(true);

    procpeek::Sampler sampler(&source, &system);
    procpeek::ListingOptions options;
    options.cpu_window = std::chrono::milliseconds(0);

    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(procpeek::run_listing(sampler, options, out, err), 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_NE(err.str().find("process table unavailable"), std::string::npos);
}
