#pragma once

#include <brsplit/Log.h>
#include <brsplit/restore/Range.h>
#include <brsplit/restore/SplitClient.h>

#include <string>
#include <vector>

namespace brsplit
{
namespace restore
{
constexpr auto restoreLabelKey = "exclusive";
constexpr auto restoreLabelValue = "restore";
constexpr int restoreRuleIndex = 100;

// RestorePlacement confines the replicas of the restored ranges to a set of
// dedicated stores while an online restore is running, so that the restore
// traffic does not disturb the stores serving other requests.
//
// Usage: setupStores, setupPlacementRules, restore the data, then
// resetPlacementRules and resetStores.
class RestorePlacement
{
public:
    RestorePlacement(SplitClientPtr client_, const std::vector<uint64_t> & store_ids_)
        : client(client_)
        , store_ids(store_ids_)
        , log(&Logger::get("brsplit.restore"))
    {}

    // Labels the stores exclusive=restore. Stops at the first failure.
    void setupStores();

    // Installs a rule for every range, derived from the rule pd/default and
    // restricted to the labelled stores. Does nothing without stores.
    void setupPlacementRules(const std::vector<KeyRange> & ranges);

    // Deletes every rule installed by setupPlacementRules. All rules are
    // tried, the errors are thrown together afterwards.
    void resetPlacementRules();

    // Clears the label set by setupStores.
    void resetStores();

    const std::vector<std::string> & ruleIDs() const { return rule_ids; }

    static std::string ruleID(size_t range_index) { return "restore-r" + std::to_string(range_index); }

private:
    SplitClientPtr client;
    const std::vector<uint64_t> store_ids;
    std::vector<std::string> rule_ids;
    Logger * log;
};

} // namespace restore
} // namespace brsplit
