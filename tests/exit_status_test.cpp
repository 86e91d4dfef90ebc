//
// Created by Giuseppe Francione on 11/12/25.
//

#include <gtest/gtest.h>
#include "exit_status.hpp"

using namespace pixtrim;

class ExitStatusTest : public ::testing::Test {
protected:
    RunSummary summary;
};

TEST_F(ExitStatusTest, CleanRunIsZero) {
    summary.processed = 3;
    summary.succeeded = 3;
    EXPECT_EQ(exit_status(summary, false), kExitOk);
    EXPECT_EQ(exit_status(summary, true), kExitOk);
}

TEST_F(ExitStatusTest, FailuresOnlyMatterWhenStrict) {
    summary.failed = 1;
    EXPECT_EQ(exit_status(summary, false), kExitOk);
    EXPECT_EQ(exit_status(summary, true), kExitFileFailed);
}

TEST_F(ExitStatusTest, InterruptWins) {
    summary.failed = 1;
    summary.cancelled = true;
    EXPECT_EQ(exit_status(summary, true), kExitInterrupted);
}
