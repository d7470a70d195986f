#pragma once

#include <brsplit/Config.h>
#include <brsplit/Log.h>
#include <brsplit/pd/IClient.h>
#include <brsplit/pd/PlacementRule.h>

#include <string>
#include <vector>

namespace brsplit
{
namespace pd
{
constexpr int pdHttpTimeout = 10;

// HttpClient reaches the HTTP API of the current PD leader. Every call is a
// single attempt: errors are raised to the caller as they are.
class HttpClient
{
public:
    HttpClient(ClientPtr pd_client_, const ClusterConfig & config_, int timeout_ = pdHttpTimeout)
        : pd_client(pd_client_)
        , config(config_)
        , timeout(timeout_)
        , log(&Logger::get("brsplit.http"))
    {}

    PlacementRule getPlacementRule(const std::string & group_id, const std::string & rule_id);

    // Inserts or updates the rule.
    void setPlacementRule(const PlacementRule & rule);

    void deletePlacementRule(const std::string & group_id, const std::string & rule_id);

    // Labels stores one by one and stops at the first failure. Stores
    // labelled before the failure keep the label. An empty value clears the label.
    void setStoresLabel(const std::vector<uint64_t> & store_ids, const std::string & label_key, const std::string & label_value);

    // Leader url with a scheme and without trailing '/', throws PDLeaderNotFound if unknown.
    std::string getPDAPIAddr();

private:
    // Returns the response body, throws unless the status is 2xx.
    std::string sendRequest(const std::string & method, const std::string & path, const std::string & body);

    ClientPtr pd_client;
    const ClusterConfig config;
    const int timeout;
    Logger * log;
};

} // namespace pd
} // namespace brsplit
