#include <gtest/gtest.h>
#include "ballsim/core/profile.hpp"

using Profiling::Profiler;

class ProfilerTest : public ::testing::Test {
protected:
    void SetUp() override { Profiler::reset(); }
    void TearDown() override { Profiler::reset(); }
};

TEST_F(ProfilerTest, CountsCalls) {
    for (int i = 0; i < 3; ++i) {
        PROFILE_SCOPE("loop");
    }
    auto stats = Profiler::getStats("loop");
    EXPECT_EQ(stats.call_count, 3u);
    EXPECT_LE(stats.min_time, stats.max_time);
    EXPECT_GE(stats.total_time, stats.max_time);
}

TEST_F(ProfilerTest, NestedTimeExcludedFromSelfTime) {
    {
        PROFILE_SCOPE("outer");
        {
            PROFILE_SCOPE("inner");
        }
    }
    auto outer = Profiler::getStats("outer");
    auto inner = Profiler::getStats("inner");
    EXPECT_EQ(outer.call_count, 1u);
    EXPECT_EQ(inner.call_count, 1u);
    EXPECT_GE(outer.total_time, inner.total_time);
    EXPECT_EQ(outer.self_time, outer.total_time - inner.total_time);
}

TEST_F(ProfilerTest, UnknownSectionIsEmpty) {
    EXPECT_EQ(Profiler::getStats("never-run").call_count, 0u);
}

TEST_F(ProfilerTest, ResetDropsStats) {
    {
        PROFILE_SCOPE("gone");
    }
    Profiler::reset();
    EXPECT_EQ(Profiler::getStats("gone").call_count, 0u);
}
