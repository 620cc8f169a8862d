#include "LossSimulator.h"

#include <gtest/gtest.h>

#include <vector>

TEST(LossSimulator, SameSeedSameDecisions) {
    LossSimulator a(30, 2024);
    LossSimulator b(30, 2024);
    for (int i = 0; i < 500; ++i) EXPECT_EQ(a.should_drop(), b.should_drop()) << i;
}

TEST(LossSimulator, ExtremesAreExact) {
    LossSimulator never(0, 1);
    LossSimulator always(100, 1);
    for (int i = 0; i < 200; ++i) {
        EXPECT_FALSE(never.should_drop());
        EXPECT_TRUE(always.should_drop());
    }
}

TEST(LossSimulator, PercentIsClamped) {
    EXPECT_EQ(LossSimulator(-5, 1).percent(), 0);
    EXPECT_EQ(LossSimulator(250, 1).percent(), 100);
}

TEST(LossSimulator, RateIsRoughlyHonoured) {
    LossSimulator sim(25, 77);
    int dropped = 0;
    for (int i = 0; i < 10000; ++i) dropped += sim.should_drop();
    EXPECT_GT(dropped, 2200);
    EXPECT_LT(dropped, 2800);
}
