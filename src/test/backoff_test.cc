#include <brsplit/Exception.h>
#include <brsplit/kv/Backoff.h>
#include <gtest/gtest.h>

namespace
{
using namespace brsplit;
using namespace brsplit::kv;

TEST(BackoffTest, testSleepDoublesUpToCap)
{
    Backoff bo(2, 8);
    ASSERT_EQ(bo.sleep(), 2);
    ASSERT_EQ(bo.sleep(), 4);
    ASSERT_EQ(bo.sleep(), 8);
    ASSERT_EQ(bo.sleep(), 8);
    ASSERT_EQ(bo.attempts, 4);
}

TEST(BackoffTest, testBackofferRethrowsWhenBudgetExhausted)
{
    // boRegionMiss sleeps 2ms, 4ms, ...
    Backoffer bo(5);
    Exception err("region miss", RegionNotFound);
    bo.backoff(boRegionMiss, err);
    ASSERT_EQ(bo.total_sleep, 2);
    try
    {
        bo.backoff(boRegionMiss, err);
        FAIL() << "backoff over budget should throw";
    }
    catch (const Exception & e)
    {
        ASSERT_EQ(e.code(), RegionNotFound);
    }
    ASSERT_EQ(bo.total_sleep, 6);
}

TEST(BackoffTest, testBackofferUnbounded)
{
    Backoffer bo(0);
    Exception err("busy", ServerIsBusy);
    for (int i = 0; i < 3; i++)
        bo.backoff(boRegionMiss, err);
    ASSERT_EQ(bo.total_sleep, 2 + 4 + 8);
}

TEST(BackoffTest, testMismatchClusterIDNotRetried)
{
    Backoffer bo(0);
    Exception err("cluster id mismatch", MismatchClusterIDCode);
    try
    {
        bo.backoff(boSplitRetry, err);
        FAIL() << "mismatched cluster id should throw";
    }
    catch (const Exception & e)
    {
        ASSERT_EQ(e.code(), MismatchClusterIDCode);
    }
    ASSERT_EQ(bo.total_sleep, 0);
}

} // namespace
