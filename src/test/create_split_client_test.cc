#include <brsplit/pd/CodecClient.h>
#include <brsplit/restore/SplitClient.h>
#include <gtest/gtest.h>

#include "mock_cluster.h"
#include "mock_pd_server.h"

namespace
{
using namespace brsplit;
using namespace brsplit::tests;

metapb::Region storedRegion(bool encoded)
{
    auto region = makeRegion(2, "a", "z");
    if (encoded)
    {
        region.set_start_key(pd::CodecClient::encodeBytes(region.start_key()));
        region.set_end_key(pd::CodecClient::encodeBytes(region.end_key()));
    }
    return region;
}

TEST(CreateSplitClientTest, testTxnClusterEncodesLookups)
{
    MockPDServer server(storedRegion(true));
    ClusterConfig config;
    auto client = restore::createSplitClient({server.addr()}, config);
    ASSERT_FALSE(client->isRawKv());

    auto region = client->getRegion("m");
    ASSERT_TRUE(region.has_value());
    ASSERT_EQ(region->id(), 2);
    ASSERT_EQ(region->startKey(), "a");
    ASSERT_EQ(region->endKey(), "z");
    ASSERT_EQ(region->leader.store_id(), 1);

    auto keys = server.service.regionKeys();
    ASSERT_EQ(keys.size(), 1);
    ASSERT_EQ(keys[0], pd::CodecClient::encodeBytes("m"));
}

TEST(CreateSplitClientTest, testRawClusterKeepsKeys)
{
    MockPDServer server(storedRegion(false));
    ClusterConfig config;
    config.api_version = kvrpcpb::APIVersion::V2;
    auto client = restore::createSplitClient({server.addr()}, config);
    ASSERT_TRUE(client->isRawKv());

    auto region = client->getRegion("m");
    ASSERT_TRUE(region.has_value());
    ASSERT_EQ(region->startKey(), "a");
    ASSERT_EQ(region->endKey(), "z");

    auto keys = server.service.regionKeys();
    ASSERT_EQ(keys.size(), 1);
    ASSERT_EQ(keys[0], "m");
}

} // namespace
