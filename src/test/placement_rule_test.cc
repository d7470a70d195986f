#include <brsplit/Exception.h>
#include <brsplit/pd/PlacementRule.h>
#include <gtest/gtest.h>

namespace
{
using namespace brsplit;
using namespace brsplit::pd;

TEST(PlacementRuleTest, testFromJSON)
{
    const std::string json = R"({
        "group_id": "pd",
        "id": "default",
        "start_key": "",
        "end_key": "",
        "role": "voter",
        "count": 3,
        "location_labels": ["zone", "host"],
        "isolation_level": "zone",
        "create_timestamp": 1700000000
    })";
    auto rule = PlacementRule::fromJSON(json);
    ASSERT_EQ(rule.group_id, "pd");
    ASSERT_EQ(rule.id, "default");
    ASSERT_EQ(rule.index, 0);
    ASSERT_FALSE(rule.override_);
    ASSERT_EQ(rule.role, "voter");
    ASSERT_EQ(rule.count, 3);
    ASSERT_TRUE(rule.label_constraints.empty());
    std::vector<std::string> labels{"zone", "host"};
    ASSERT_EQ(rule.location_labels, labels);
    ASSERT_EQ(rule.isolation_level, "zone");
}

TEST(PlacementRuleTest, testToJSON)
{
    PlacementRule rule;
    rule.group_id = "pd";
    rule.id = "restore-r0";
    rule.index = 100;
    rule.override_ = true;
    rule.start_key_hex = "6100000000000000F8";
    rule.count = 3;
    rule.label_constraints.push_back(LabelConstraint{"exclusive", "in", {"restore"}});

    auto parsed = PlacementRule::fromJSON(rule.toJSON());
    ASSERT_EQ(parsed.group_id, "pd");
    ASSERT_EQ(parsed.id, "restore-r0");
    ASSERT_EQ(parsed.index, 100);
    ASSERT_TRUE(parsed.override_);
    ASSERT_EQ(parsed.start_key_hex, "6100000000000000F8");
    ASSERT_EQ(parsed.end_key_hex, "");
    ASSERT_EQ(parsed.count, 3);
    ASSERT_EQ(parsed.label_constraints.size(), 1);
    ASSERT_EQ(parsed.label_constraints[0], rule.label_constraints[0]);

    auto json = rule.toJSON();
    ASSERT_NE(json.find("\"label_constraints\""), std::string::npos);
    ASSERT_EQ(json.find("location_labels"), std::string::npos);
}

TEST(PlacementRuleTest, testMalformed)
{
    ASSERT_THROW(PlacementRule::fromJSON("not json"), Exception);
    ASSERT_THROW(PlacementRule::fromJSON("[1, 2]"), Exception);
    try
    {
        PlacementRule::fromJSON(R"({"label_constraints": 1})");
        FAIL() << "parse should fail";
    }
    catch (const Exception & e)
    {
        ASSERT_EQ(e.code(), PlacementRuleError);
    }
}

} // namespace
