#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include "../include/Diffeo.h"

using Diffeo::Training::EarlyStopping;
using Diffeo::Training::EarlyStoppingOptions;

TEST(EarlyStoppingTest, StopsAfterPatienceStepsWithoutImprovement) {
    EarlyStopping stopper(EarlyStoppingOptions{.patience = 2});

    EXPECT_FALSE(stopper.step(1.0));
    EXPECT_FALSE(stopper.step(1.5));
    EXPECT_TRUE(stopper.step(1.2));
    EXPECT_DOUBLE_EQ(stopper.best(), 1.0);
    EXPECT_EQ(stopper.bad_steps(), 2);
}

TEST(EarlyStoppingTest, ImprovementResetsTheCounter) {
    EarlyStopping stopper(EarlyStoppingOptions{.patience = 2});

    EXPECT_FALSE(stopper.step(1.0));
    EXPECT_FALSE(stopper.step(1.1));
    EXPECT_FALSE(stopper.step(0.5));
    EXPECT_EQ(stopper.bad_steps(), 0);
    EXPECT_FALSE(stopper.step(0.6));
    EXPECT_TRUE(stopper.step(0.7));
}

TEST(EarlyStoppingTest, MinDeltaRequiresAMeaningfulImprovement) {
    EarlyStopping stopper(EarlyStoppingOptions{.patience = 1, .min_delta = 0.1});

    EXPECT_FALSE(stopper.step(1.0));
    EXPECT_TRUE(stopper.step(0.95));
}

TEST(EarlyStoppingTest, MaxModeTracksIncreasingValues) {
    EarlyStopping stopper(EarlyStoppingOptions{.mode = EarlyStoppingOptions::Mode::Max, .patience = 1});

    EXPECT_FALSE(stopper.step(0.5));
    EXPECT_FALSE(stopper.step(0.7));
    EXPECT_TRUE(stopper.step(0.6));
    EXPECT_DOUBLE_EQ(stopper.best(), 0.7);
}

TEST(EarlyStoppingTest, NaNStopsImmediately) {
    EarlyStopping stopper;

    EXPECT_TRUE(stopper.step(std::numeric_limits<double>::quiet_NaN()));
}

TEST(EarlyStoppingTest, ZeroPatienceStopsOnTheFirstStepWithoutImprovement) {
    EarlyStopping stopper(EarlyStoppingOptions{.patience = 0});

    EXPECT_FALSE(stopper.step(1.0));
    EXPECT_FALSE(stopper.step(0.5));
    EXPECT_TRUE(stopper.step(0.5));
    EXPECT_EQ(stopper.bad_steps(), 1);
}

TEST(EarlyStoppingTest, RejectsNegativePatience) {
    EXPECT_THROW((void)EarlyStopping(EarlyStoppingOptions{.patience = -1}), std::invalid_argument);
}
