/// @file test_signal_guard.cpp
/// @brief Tests that SignalHandlerGuard installs its handler and puts the
/// previous one back.

#include "signal_guard.hpp"

#include <gtest/gtest.h>

#include <csignal>

namespace
{

void outerHandler(int) {}
void innerHandler(int) {}

} // namespace

TEST(SignalHandlerGuardTest, InstallsAndRestoresPreviousHandler)
{
    const auto original = std::signal(SIGWINCH, outerHandler);
    ASSERT_TRUE(original != SIG_ERR);

    {
        procpeek::SignalHandlerGuard guard(SIGWINCH, innerHandler);
        EXPECT_TRUE(guard.active());

        // std::signal reports the handler it replaces
        EXPECT_TRUE(std::signal(SIGWINCH, innerHandler) == innerHandler);
    }

    EXPECT_TRUE(std::signal(SIGWINCH, original) == outerHandler);
}

TEST(SignalHandlerGuardTest, NestedGuardsUnwindInOrder)
{
    const auto original = std::signal(SIGWINCH, SIG_DFL);
    ASSERT_TRUE(original != SIG_ERR);

    {
        procpeek::SignalHandlerGuard outer(SIGWINCH, outerHandler);
        {
            procpeek::SignalHandlerGuard inner(SIGWINCH, innerHandler);
        }
        EXPECT_TRUE(std::signal(SIGWINCH, outerHandler) == outerHandler);
    }

    EXPECT_TRUE(std::signal(SIGWINCH, original) == SIG_DFL);
}
