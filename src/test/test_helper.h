#pragma once

#include <brsplit/Config.h>
#include <brsplit/restore/RegionInfo.h>
#include <brsplit/restore/SplitClient.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mock_cluster.h"

namespace brsplit
{
namespace tests
{
inline ClusterConfig rawKvConfig()
{
    ClusterConfig config;
    config.api_version = kvrpcpb::APIVersion::V2;
    return config;
}

inline std::shared_ptr<restore::SplitClient> createSplitClient(
    pd::ClientPtr pd_client,
    kv::StoreClientPtr store_client,
    const ClusterConfig & config = rawKvConfig())
{
    return std::make_shared<restore::SplitClient>(pd_client, store_client, config);
}

inline std::string toString(const std::vector<restore::RegionInfo> & regions)
{
    std::string res("[");
    for (size_t i = 0; i < regions.size(); ++i)
    {
        if (i > 0)
            res += ",";
        res += "[" + regions[i].startKey() + "," + regions[i].endKey() + ")";
    }
    res += "]";
    return res;
}

/// helper functions for checking the bounds of regions, given as {start_0, start_1, ..., end_n}
inline ::testing::AssertionResult regionBoundsCompare(
    const char * lhs_expr,
    const char * rhs_expr,
    const std::vector<restore::RegionInfo> & lhs,
    const std::vector<std::string> & rhs)
{
    bool match = rhs.size() == lhs.size() + 1;
    for (size_t i = 0; match && i < lhs.size(); ++i)
        match = lhs[i].startKey() == rhs[i] && lhs[i].endKey() == rhs[i + 1];
    if (match)
        return ::testing::AssertionSuccess();

    std::string expected("[");
    for (size_t i = 0; i + 1 < rhs.size(); ++i)
    {
        if (i > 0)
            expected += ",";
        expected += "[" + rhs[i] + "," + rhs[i + 1] + ")";
    }
    expected += "]";
    return ::testing::internal::EqFailure(lhs_expr, rhs_expr, toString(lhs), expected, false);
}
#define ASSERT_REGION_BOUNDS_EQ(val1, val2) ASSERT_PRED_FORMAT2(::brsplit::tests::regionBoundsCompare, val1, val2)
#define EXPECT_REGION_BOUNDS_EQ(val1, val2) EXPECT_PRED_FORMAT2(::brsplit::tests::regionBoundsCompare, val1, val2)

} // namespace tests
} // namespace brsplit
