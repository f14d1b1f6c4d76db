/// @file test_procfs_reader.cpp
/// @brief Tests for ProcfsReader against the live /proc and a fake proc root

#include "procfs_reader.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;

namespace
{

// Temporary directory laid out like /proc, removed on destruction
class FakeProcRoot
{
public:
    FakeProcRoot()
    {
        m_root = fs::temp_directory_path() / ("proc-peek-test-" + std::to_string(::getpid()));
        fs::remove_all(m_root);
        fs::create_directories(m_root);
    }

    ~FakeProcRoot()
    {
        std::error_code ec;
        fs::remove_all(m_root, ec);
    }

    FakeProcRoot(const FakeProcRoot&) = delete;
    FakeProcRoot& operator=(const FakeProcRoot&) = delete;

    void writeFile(const std::string& relative, const std::string& content) const
    {
        const auto path = m_root / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    [[nodiscard]] std::string path() const
    {
        return m_root.string();
    }

private:
    fs::path m_root;
};

} // namespace

// =============================================================================
// Live /proc
// =============================================================================

TEST(ProcfsReaderTest, ListsOwnPid)
{
    procpeek::ProcfsReader reader;
    const auto pids = reader.list_pids();
    EXPECT_NE(std::ranges::find(pids, ::getpid()), pids.end());
}

TEST(ProcfsReaderTest, ReadsOwnCounters)
{
    procpeek::ProcfsReader reader;
    const auto counters = reader.read_counters(::getpid());

    EXPECT_EQ(counters.pid, ::getpid());
    EXPECT_FALSE(counters.name.empty());
    EXPECT_GT(counters.resident_memory, 0);
    EXPECT_GE(counters.thread_count, 1);
    EXPECT_FALSE(counters.user_name.empty());
}

TEST(ProcfsReaderTest, MissingPidThrowsAccessError)
{
    procpeek::ProcfsReader reader;
    // Above the kernel's pid_max limit
    constexpr int kImpossiblePid = 999999999;
    try
    {
        (void)reader.read_counters(kImpossiblePid);
        FAIL() << "expected ProcessAccessError";
    }
    catch (const procpeek::ProcessAccessError& e)
    {
        EXPECT_EQ(e.pid(), kImpossiblePid);
    }
}

TEST(ProcfsReaderTest, OwnDetails)
{
    procpeek::ProcfsReader reader;
    const auto details = reader.get_process_details(::getpid());
    ASSERT_TRUE(details.has_value());

    EXPECT_EQ(details->pid, ::getpid());
    EXPECT_EQ(details->parent_pid, ::getppid());
    ASSERT_TRUE(details->command_line.has_value());
    EXPECT_FALSE(details->command_line->empty());
    ASSERT_TRUE(details->executable_path.has_value());
    EXPECT_FALSE(details->executable_path->empty());
    EXPECT_GT(details->virtual_memory, 0);
}

TEST(ProcfsReaderTest, DetailsForMissingPidAreEmpty)
{
    procpeek::ProcfsReader reader;
    EXPECT_FALSE(reader.get_process_details(999999999).has_value());
}

// =============================================================================
// Fake proc root
// =============================================================================

TEST(ProcfsReaderTest, ListSkipsNonNumericEntries)
{
    FakeProcRoot root;
    root.writeFile("123/stat", "");
    root.writeFile("45/stat", "");
    root.writeFile("self/stat", "");
    root.writeFile("meminfo", "");

    procpeek::ProcfsReader reader(root.path());
    auto pids = reader.list_pids();
    std::ranges::sort(pids);
    EXPECT_EQ(pids, (std::vector<int>{45, 123}));
}

TEST(ProcfsReaderTest, MalformedStatIsAccessErrorAndRecorded)
{
    FakeProcRoot root;
    root.writeFile("123/stat", "this is not a stat line");
    root.writeFile("123/statm", "100 50 10 1 0 20 0");

    procpeek::ProcfsReader reader(root.path());
    EXPECT_THROW((void)reader.read_counters(123), procpeek::ProcessAccessError);

    const auto errors = reader.get_recent_errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].message.find("123"), std::string::npos);

    reader.clear_errors();
    EXPECT_TRUE(reader.get_recent_errors().empty());
}

TEST(ProcfsReaderTest, CommWithSpacesAndParens)
{
    FakeProcRoot root;
    root.writeFile("77/stat",
                   "77 (odd (name) x) S 1 77 77 0 -1 4194304 10 0 0 0 "
                   "25 5 0 0 20 0 3 0 100 1000000 50 18446744073709551615");
    root.writeFile("77/statm", "250 50 10 1 0 20 0");

    procpeek::ProcfsReader reader(root.path());
    const auto counters = reader.read_counters(77);

    EXPECT_EQ(counters.name, "odd (name) x");
    EXPECT_EQ(counters.state_char, 'S');
    EXPECT_EQ(counters.user_time, 25u);
    EXPECT_EQ(counters.kernel_time, 5u);
    EXPECT_EQ(counters.thread_count, 3);
    EXPECT_EQ(counters.resident_memory, 50 * static_cast<int64_t>(::sysconf(_SC_PAGESIZE)));
}

TEST(ProcfsReaderTest, MissingRootThrowsSamplingError)
{
    procpeek::ProcfsReader reader("/nonexistent/proc-peek/proc");
    EXPECT_THROW((void)reader.list_pids(), procpeek::SamplingError);
}
