#include <brsplit/Exception.h>
#include <brsplit/RedactHelpers.h>
#include <brsplit/pd/CodecClient.h>
#include <brsplit/restore/RestorePlacement.h>

namespace brsplit
{
namespace restore
{
namespace
{
// Placement rules address keys the way the cluster stores them.
std::string ruleKeyHex(const std::string & key, bool is_raw_kv)
{
    if (key.empty())
        return "";
    if (is_raw_kv)
        return Redact::keyToHexString(key);
    return Redact::keyToHexString(pd::CodecClient::encodeBytes(key));
}
} // namespace

void RestorePlacement::setupStores()
{
    if (store_ids.empty())
        return;
    client->setStoresLabel(store_ids, restoreLabelKey, restoreLabelValue);
    log->information("set label " + std::string(restoreLabelKey) + "=" + restoreLabelValue + " on " + std::to_string(store_ids.size()) + " stores");
}

void RestorePlacement::setupPlacementRules(const std::vector<KeyRange> & ranges)
{
    if (store_ids.empty())
        return;

    auto rule = client->getPlacementRule("pd", "default");
    rule.index = restoreRuleIndex;
    rule.override_ = true;
    rule.label_constraints.push_back(pd::LabelConstraint{restoreLabelKey, "in", {restoreLabelValue}});

    const bool is_raw_kv = client->isRawKv();
    for (size_t i = 0; i < ranges.size(); i++)
    {
        rule.id = ruleID(i);
        rule.start_key_hex = ruleKeyHex(ranges[i].start_key, is_raw_kv);
        rule.end_key_hex = ruleKeyHex(ranges[i].end_key, is_raw_kv);
        client->setPlacementRule(rule);
        rule_ids.push_back(rule.id);
        log->debug("set placement rule " + rule.id + " for range " + ranges[i].toString());
    }
    log->information("set " + std::to_string(ranges.size()) + " placement rules for restore");
}

void RestorePlacement::resetPlacementRules()
{
    MultiException reset_errors;
    std::vector<std::string> failed;
    for (const auto & rule_id : rule_ids)
    {
        try
        {
            client->deletePlacementRule("pd", rule_id);
        }
        catch (const Exception & e)
        {
            log->warning("failed to delete placement rule " + rule_id + ": " + e.displayText());
            reset_errors.append(e);
            failed.push_back(rule_id);
        }
    }
    rule_ids.swap(failed);
    if (reset_errors.size() > 0)
        throw reset_errors;
}

void RestorePlacement::resetStores()
{
    if (store_ids.empty())
        return;
    client->setStoresLabel(store_ids, restoreLabelKey, "");
    log->information("cleared label " + std::string(restoreLabelKey) + " on " + std::to_string(store_ids.size()) + " stores");
}

} // namespace restore
} // namespace brsplit
