/// @file test_data_store.cpp
/// @brief Tests for the DataStore collector: publishing, skip-on-timeout,
/// error reporting and prompt cancellation.

#include "data_store.hpp"
#include "mock_providers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using TestMocks::makeCounters;
using TestMocks::MockProcessSource;
using TestMocks::MockSystemProvider;

namespace
{

bool containsMessage(const std::vector<procpeek::ParseError>& errors, const std::string& needle)
{
    for (const auto& e : errors)
    {
        if (e.message.find(needle) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

class DataStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        source.setProcesses({makeCounters(1, "init"), makeCounters(2, "shell"), makeCounters(3, "editor")});
    }

    MockProcessSource source;
    MockSystemProvider system;
    procpeek::Sampler sampler{&source, &system};
};

} // namespace

// =============================================================================
// Publishing
// =============================================================================

TEST(DataStoreConstructionTest, NullArgumentsAreRejected)
{
    MockProcessSource source;
    MockSystemProvider system;
    procpeek::Sampler sampler(&source, &system);
    EXPECT_THROW(procpeek::DataStore(nullptr, &source), std::invalid_argument);
    EXPECT_THROW(procpeek::DataStore(&sampler, nullptr), std::invalid_argument);
}

TEST_F(DataStoreTest, InitialSnapshotIsEmptyButNeverNull)
{
    procpeek::DataStore store(&sampler, &source);
    const auto snap = store.get_snapshot();
    ASSERT_NE(snap, nullptr);
    EXPECT_TRUE(snap->processes.empty());
    EXPECT_EQ(snap->sequence, 0u);
}

TEST_F(DataStoreTest, TickPublishesNewSnapshot)
{
    procpeek::DataStore store(&sampler, &source);
    EXPECT_TRUE(store.tick());

    const auto snap = store.get_snapshot();
    EXPECT_EQ(snap->processes.size(), 3u);
    EXPECT_GT(snap->sequence, 0u);
}

TEST_F(DataStoreTest, PublishedSnapshotIsNotAffectedByLaterTicks)
{
    procpeek::DataStore store(&sampler, &source);
    ASSERT_TRUE(store.tick());
    const auto held = store.get_snapshot();

    source.setProcesses({makeCounters(9, "other")});
    ASSERT_TRUE(store.tick());

    EXPECT_EQ(held->processes.size(), 3u);
    EXPECT_TRUE(store.get_snapshot()->contains(9));
}

// =============================================================================
// Failures and timeouts
// =============================================================================

TEST_F(DataStoreTest, SamplingFailureKeepsPreviousSnapshotAndRaisesBanner)
{
    procpeek::DataStore store(&sampler, &source);
    ASSERT_TRUE(store.tick());
    const auto before = store.get_snapshot();

    source.setListingFails(true);
    EXPECT_FALSE(store.tick());

    EXPECT_EQ(store.get_snapshot(), before);
    EXPECT_EQ(store.failed_ticks(), 1u);
    EXPECT_TRUE(containsMessage(store.get_recent_errors(), "Sampling failed"));
}

TEST_F(DataStoreTest, SlowPassIsSkippedAndPreviousSnapshotRetained)
{
    procpeek::DataStore store(&sampler, &source);
    ASSERT_TRUE(store.tick());
    const auto before = store.get_snapshot();

    // Three reads at 40 ms each cannot finish inside 50 ms
    store.set_sample_timeout(50);
    source.setReadDelay(std::chrono::milliseconds(40));
    EXPECT_FALSE(store.tick());

    EXPECT_EQ(store.get_snapshot(), before);
    EXPECT_EQ(store.skipped_ticks(), 1u);
    EXPECT_TRUE(containsMessage(store.get_recent_errors(), "longer than 50 ms"));
}

TEST_F(DataStoreTest, SourceErrorsAreMergedIntoRecentErrors)
{
    procpeek::DataStore store(&sampler, &source);
    source.addError("PID 42: malformed stat");

    const auto errors = store.get_recent_errors();
    EXPECT_TRUE(containsMessage(errors, "PID 42"));
}

TEST_F(DataStoreTest, ClearErrorsDropsCollectorAndSourceErrors)
{
    procpeek::DataStore store(&sampler, &source);
    source.setListingFails(true);
    EXPECT_FALSE(store.tick());
    source.addError("PID 42: malformed stat");
    ASSERT_EQ(store.get_recent_errors().size(), 2u);

    store.clear_errors();

    EXPECT_TRUE(store.get_recent_errors().empty());
    EXPECT_TRUE(source.get_recent_errors().empty());
}

TEST_F(DataStoreTest, IntervalAndTimeoutAreAdjustable)
{
    procpeek::DataStore store(&sampler, &source);
    store.set_refresh_interval(250);
    store.set_sample_timeout(125);
    EXPECT_EQ(store.get_refresh_interval(), 250);
    EXPECT_EQ(store.get_sample_timeout(), 125);
}

// =============================================================================
// Background collector
// =============================================================================

TEST_F(DataStoreTest, CollectorPublishesAfterStart)
{
    procpeek::DataStore store(&sampler, &source);
    store.set_refresh_interval(100);
    store.start();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (store.get_snapshot()->sequence == 0 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    store.stop();

    const auto snap = store.get_snapshot();
    EXPECT_GT(snap->sequence, 0u);
    EXPECT_EQ(snap->processes.size(), 3u);
}

TEST_F(DataStoreTest, StopCancelsInFlightPassPromptly)
{
    std::vector<procpeek::ProcessCounters> many;
    for (int pid = 1; pid <= 200; ++pid)
    {
        many.push_back(makeCounters(pid, "proc"));
    }
    source.setProcesses(many);
    source.setReadDelay(std::chrono::milliseconds(20));  // ~4 s per full pass

    procpeek::DataStore store(&sampler, &source);
    store.set_sample_timeout(60000);
    store.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    const auto begin = std::chrono::steady_clock::now();
    store.stop();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, std::chrono::seconds(1));
    EXPECT_EQ(store.skipped_ticks(), 0u);  // cancellation is not a timeout
    EXPECT_EQ(store.get_snapshot()->sequence, 0u);
}

TEST_F(DataStoreTest, StopWakesCollectorFromLongIntervalEveryTime)
{
    procpeek::DataStore store(&sampler, &source);
    store.set_refresh_interval(60000);

    uint64_t seen = 0;
    for (int round = 0; round < 25; ++round)
    {
        store.start();

        // Wait for this round's pass so the collector is heading into its 60 s wait
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (store.get_snapshot()->sequence == seen && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::microseconds(50));
        }
        ASSERT_GT(store.get_snapshot()->sequence, seen) << "round " << round;
        seen = store.get_snapshot()->sequence;

        // Stagger the stop so it lands at different points around the wait
        std::this_thread::sleep_for(std::chrono::microseconds((round * 37) % 400));

        const auto begin = std::chrono::steady_clock::now();
        store.stop();
        EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1)) << "round " << round;
    }
}

TEST_F(DataStoreTest, StopWithoutStartIsHarmless)
{
    procpeek::DataStore store(&sampler, &source);
    store.stop();
    SUCCEED();
}
