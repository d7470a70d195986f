#include <brsplit/Exception.h>
#include <brsplit/pd/CodecClient.h>
#include <brsplit/restore/RestorePlacement.h>

#include "mock_cluster.h"
#include "mock_pd_http.h"
#include "test_helper.h"

namespace
{
using namespace brsplit;
using namespace brsplit::restore;
using namespace brsplit::tests;

class TestWithRestorePlacement : public testing::Test
{
protected:
    void SetUp() override
    {
        mock_pd = createMockPD();
        mock_pd->setLeaderUrl(server.url());
        server.setReply("GET", "/pd/api/v1/config/rule/pd/default", 200, R"({"group_id":"pd","id":"default","role":"voter","count":3,"location_labels":["host"]})");
    }

    std::shared_ptr<SplitClient> createClient(const ClusterConfig & config)
    {
        return createSplitClient(mock_pd, std::make_shared<MockStoreClient>(mock_pd), config);
    }

    MockPDHttp server;
    pd::MockPDClientPtr mock_pd;
};

TEST_F(TestWithRestorePlacement, testSetupAndReset)
{
    RestorePlacement placement(createClient(rawKvConfig()), {1, 2});
    std::vector<KeyRange> ranges{{"a", "c"}, {"x", ""}};

    placement.setupStores();
    placement.setupPlacementRules(ranges);
    ASSERT_EQ(placement.ruleIDs().size(), 2);

    auto requests = server.requests();
    // 2 labels, 1 default rule, 2 rules
    ASSERT_EQ(requests.size(), 5);
    ASSERT_EQ(requests[0].uri, "/pd/api/v1/store/1/label");
    ASSERT_NE(requests[0].body.find("restore"), std::string::npos);

    auto rule = pd::PlacementRule::fromJSON(requests[3].body);
    ASSERT_EQ(rule.id, "restore-r0");
    ASSERT_EQ(rule.index, restoreRuleIndex);
    ASSERT_TRUE(rule.override_);
    ASSERT_EQ(rule.count, 3);
    ASSERT_EQ(rule.start_key_hex, "61");
    ASSERT_EQ(rule.end_key_hex, "63");
    std::vector<std::string> host{"host"};
    ASSERT_EQ(rule.location_labels, host);
    ASSERT_EQ(rule.label_constraints.size(), 1);
    ASSERT_EQ(rule.label_constraints[0], (pd::LabelConstraint{"exclusive", "in", {"restore"}}));

    auto unbounded = pd::PlacementRule::fromJSON(requests[4].body);
    ASSERT_EQ(unbounded.id, "restore-r1");
    ASSERT_EQ(unbounded.end_key_hex, "");

    placement.resetPlacementRules();
    placement.resetStores();
    ASSERT_TRUE(placement.ruleIDs().empty());

    requests = server.requests();
    ASSERT_EQ(requests.size(), 9);
    ASSERT_EQ(requests[5].method, "DELETE");
    ASSERT_EQ(requests[5].uri, "/pd/api/v1/config/rule/pd/restore-r0");
    ASSERT_EQ(requests[6].uri, "/pd/api/v1/config/rule/pd/restore-r1");
    ASSERT_EQ(requests[8].uri, "/pd/api/v1/store/2/label");
    ASSERT_EQ(requests[8].body.find("restore"), std::string::npos);
}

TEST_F(TestWithRestorePlacement, testEncodedRuleKeys)
{
    RestorePlacement placement(createClient(ClusterConfig()), {1});
    placement.setupPlacementRules({{"a", "c"}});

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 2);
    auto rule = pd::PlacementRule::fromJSON(requests[1].body);
    ASSERT_EQ(rule.start_key_hex, Redact::keyToHexString(pd::CodecClient::encodeBytes("a")));
    ASSERT_EQ(rule.end_key_hex, "6300000000000000F8");
}

TEST_F(TestWithRestorePlacement, testNoStores)
{
    RestorePlacement placement(createClient(rawKvConfig()), {});
    placement.setupStores();
    placement.setupPlacementRules({{"a", "c"}});
    placement.resetPlacementRules();
    placement.resetStores();
    ASSERT_TRUE(server.requests().empty());
}

TEST_F(TestWithRestorePlacement, testResetKeepsFailedRules)
{
    RestorePlacement placement(createClient(rawKvConfig()), {1});
    placement.setupPlacementRules({{"a", "c"}, {"d", "f"}});

    server.setReply("DELETE", "/pd/api/v1/config/rule/pd/restore-r0", 500, "busy");
    try
    {
        placement.resetPlacementRules();
        FAIL() << "reset should fail";
    }
    catch (const MultiException & e)
    {
        ASSERT_EQ(e.size(), 1);
        ASSERT_EQ(e.code(), PlacementRuleError);
    }
    // the second rule is still deleted
    auto requests = server.requests();
    ASSERT_EQ(requests.back().uri, "/pd/api/v1/config/rule/pd/restore-r1");
    ASSERT_EQ(placement.ruleIDs().size(), 1);
    ASSERT_EQ(placement.ruleIDs()[0], "restore-r0");
}

} // namespace
