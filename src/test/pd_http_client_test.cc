#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <brsplit/Exception.h>
#include <brsplit/pd/HttpClient.h>
#include <brsplit/pd/MockPDClient.h>

#include "mock_pd_http.h"
#include "test_helper.h"

namespace
{
using namespace brsplit;
using namespace brsplit::pd;
using namespace brsplit::tests;

class TestWithPDHttp : public testing::Test
{
protected:
    void SetUp() override
    {
        mock_pd = std::make_shared<MockPDClient>();
        mock_pd->setLeaderUrl(server.url());
        client = std::make_unique<HttpClient>(mock_pd, ClusterConfig(), 5);
    }

    MockPDHttp server;
    MockPDClientPtr mock_pd;
    std::unique_ptr<HttpClient> client;
};

TEST_F(TestWithPDHttp, testPDAPIAddr)
{
    mock_pd->setLeaderUrl("127.0.0.1:2379//");
    ASSERT_EQ(client->getPDAPIAddr(), "http://127.0.0.1:2379");
    mock_pd->setLeaderUrl("https://pd0:2379/");
    ASSERT_EQ(client->getPDAPIAddr(), "https://pd0:2379");

    mock_pd->setLeaderUrl("");
    try
    {
        client->getPDAPIAddr();
        FAIL() << "no leader";
    }
    catch (const Exception & e)
    {
        ASSERT_EQ(e.code(), PDLeaderNotFound);
    }
}

TEST_F(TestWithPDHttp, testGetPlacementRule)
{
    server.setReply("GET", "/pd/api/v1/config/rule/pd/default", 200, R"({"group_id":"pd","id":"default","role":"voter","count":5})");
    auto rule = client->getPlacementRule("pd", "default");
    ASSERT_EQ(rule.count, 5);
    ASSERT_EQ(rule.role, "voter");

    server.setReply("GET", "/pd/api/v1/config/rule/pd/missing", 404, "rule not found");
    try
    {
        client->getPlacementRule("pd", "missing");
        FAIL() << "rule should be missing";
    }
    catch (const Exception & e)
    {
        ASSERT_EQ(e.code(), PlacementRuleError);
        ASSERT_NE(e.message().find("404"), std::string::npos);
    }
}

TEST_F(TestWithPDHttp, testSetAndDeletePlacementRule)
{
    PlacementRule rule;
    rule.group_id = "pd";
    rule.id = "restore-r0";
    rule.count = 3;
    client->setPlacementRule(rule);
    client->deletePlacementRule("pd", "restore-r0");

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 2);
    ASSERT_EQ(requests[0].method, "POST");
    ASSERT_EQ(requests[0].uri, "/pd/api/v1/config/rule");
    ASSERT_EQ(PlacementRule::fromJSON(requests[0].body).id, "restore-r0");
    ASSERT_EQ(requests[1].method, "DELETE");
    ASSERT_EQ(requests[1].uri, "/pd/api/v1/config/rule/pd/restore-r0");

    server.setReply("POST", "/pd/api/v1/config/rule", 500, "boom");
    ASSERT_THROW(client->setPlacementRule(rule), Exception);
}

TEST_F(TestWithPDHttp, testSetStoresLabel)
{
    client->setStoresLabel({1, 2, 3}, "exclusive", "restore");
    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 3);
    for (size_t i = 0; i < requests.size(); i++)
    {
        ASSERT_EQ(requests[i].method, "POST");
        ASSERT_EQ(requests[i].uri, "/pd/api/v1/store/" + std::to_string(i + 1) + "/label");
        Poco::JSON::Parser parser;
        auto obj = parser.parse(requests[i].body).extract<Poco::JSON::Object::Ptr>();
        ASSERT_EQ(obj->size(), 1);
        ASSERT_EQ(obj->getValue<std::string>("exclusive"), "restore");
    }
}

TEST_F(TestWithPDHttp, testSetStoresLabelStopsAtFailure)
{
    server.setReply("POST", "/pd/api/v1/store/2/label", 500, "store is down");
    ASSERT_THROW(client->setStoresLabel({1, 2, 3}, "exclusive", "restore"), Exception);
    // store 1 keeps its label, store 3 is never asked
    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 2);
    ASSERT_EQ(requests[1].uri, "/pd/api/v1/store/2/label");
}

TEST_F(TestWithPDHttp, testUnreachableLeader)
{
    // nothing listens on port 1
    mock_pd->setLeaderUrl("127.0.0.1:1");
    try
    {
        client->deletePlacementRule("pd", "x");
        FAIL() << "request should fail";
    }
    catch (const Exception & e)
    {
        ASSERT_EQ(e.code(), PlacementRuleError);
    }
}

} // namespace
