#pragma once

#include <string>
#include <vector>

namespace brsplit
{
namespace pd
{
struct LabelConstraint
{
    std::string key;
    // one of "in", "notIn", "exists", "notExists"
    std::string op;
    std::vector<std::string> values;

    bool operator==(const LabelConstraint & rhs) const { return key == rhs.key && op == rhs.op && values == rhs.values; }
};

// PlacementRule mirrors the rule document of the PD placement API. Keys are
// hex strings of the keys as stored by the cluster.
struct PlacementRule
{
    std::string group_id;
    std::string id;
    int index = 0;
    bool override_ = false;
    std::string start_key_hex;
    std::string end_key_hex;
    // one of "voter", "leader", "follower", "learner"
    std::string role = "voter";
    int count = 0;
    std::vector<LabelConstraint> label_constraints;
    std::vector<std::string> location_labels;
    std::string isolation_level;

    std::string toJSON() const;

    // Throws Exception(PlacementRuleError) on malformed documents.
    static PlacementRule fromJSON(const std::string & json);
};

} // namespace pd
} // namespace brsplit
