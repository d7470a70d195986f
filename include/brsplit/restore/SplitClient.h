#pragma once

#include <brsplit/Config.h>
#include <brsplit/Exception.h>
#include <brsplit/Log.h>
#include <brsplit/kv/StoreClient.h>
#include <brsplit/pd/HttpClient.h>
#include <brsplit/pd/IClient.h>
#include <brsplit/pd/PlacementRule.h>
#include <brsplit/restore/RegionInfo.h>
#include <brsplit/restore/StoreCache.h>
#include <kvproto/errorpb.pb.h>
#include <kvproto/kvrpcpb.pb.h>
#include <kvproto/pdpb.pb.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace brsplit
{
namespace restore
{
constexpr int splitRegionMaxRetryTime = 4;

struct SplitResult
{
    // the region that kept the id of the split region
    std::optional<RegionInfo> origin;
    std::vector<RegionInfo> new_regions;
};

// ISplitClient is everything the restore planner needs from the cluster:
// region lookups, splitting, scattering and the placement side channel.
// All keys are raw, i.e. not memcomparable encoded.
class ISplitClient
{
public:
    virtual ~ISplitClient() = default;

    virtual metapb::Store getStore(uint64_t store_id) = 0;

    // Region containing key, nullopt if the cluster knows none.
    virtual std::optional<RegionInfo> getRegion(const std::string & key) = 0;

    virtual std::optional<RegionInfo> getRegionByID(uint64_t region_id) = 0;

    // Splits region_info at key and returns the region starting at the
    // original start key. Returns nullopt without any request if key is not
    // strictly inside the region.
    virtual std::optional<RegionInfo> splitRegion(const RegionInfo & region_info, const std::string & key) = 0;

    // Splits region_info at keys (ascending, unique, strictly inside) and returns the new regions.
    virtual std::vector<RegionInfo> batchSplitRegions(const RegionInfo & region_info, const std::vector<std::string> & keys) = 0;

    virtual SplitResult batchSplitRegionsWithOrigin(const RegionInfo & region_info, const std::vector<std::string> & keys) = 0;

    virtual void scatterRegion(const RegionInfo & region_info) = 0;

    virtual pdpb::GetOperatorResponse getOperator(uint64_t region_id) = 0;

    // Up to limit regions in key order, starting from the one containing key.
    virtual std::vector<RegionInfo> scanRegions(const std::string & key, const std::string & end_key, int limit) = 0;

    virtual pd::PlacementRule getPlacementRule(const std::string & group_id, const std::string & rule_id) = 0;

    virtual void setPlacementRule(const pd::PlacementRule & rule) = 0;

    virtual void deletePlacementRule(const std::string & group_id, const std::string & rule_id) = 0;

    virtual void setStoresLabel(const std::vector<uint64_t> & store_ids, const std::string & label_key, const std::string & label_value) = 0;

    // Whether region keys live memcomparable encoded in the cluster.
    virtual bool isRawKv() const = 0;
};

using SplitClientPtr = std::shared_ptr<ISplitClient>;

// SplitClient sends split requests to the leader of a region and repairs its
// view of the region between attempts. NotLeader, ServerIsBusy and
// StaleCommand are retried, up to splitRegionMaxRetryTime attempts in total.
// Every other region error fails the call at once, since the client has
// nothing to repair the request with. A failed call throws a MultiException
// holding the error of every attempt.
//
// pd_client must match the key mode of config: raw keys for raw KV, a
// pd::CodecClient for transactional clusters. createSplitClient pairs them.
//
// Thread safe, attempts for one region are sequential.
class SplitClient : public ISplitClient
{
public:
    SplitClient(pd::ClientPtr pd_client_, kv::StoreClientPtr store_client_, const ClusterConfig & config);

    metapb::Store getStore(uint64_t store_id) override;

    std::optional<RegionInfo> getRegion(const std::string & key) override;

    std::optional<RegionInfo> getRegionByID(uint64_t region_id) override;

    std::optional<RegionInfo> splitRegion(const RegionInfo & region_info, const std::string & key) override;

    std::vector<RegionInfo> batchSplitRegions(const RegionInfo & region_info, const std::vector<std::string> & keys) override;

    SplitResult batchSplitRegionsWithOrigin(const RegionInfo & region_info, const std::vector<std::string> & keys) override;

    void scatterRegion(const RegionInfo & region_info) override;

    pdpb::GetOperatorResponse getOperator(uint64_t region_id) override;

    std::vector<RegionInfo> scanRegions(const std::string & key, const std::string & end_key, int limit) override;

    pd::PlacementRule getPlacementRule(const std::string & group_id, const std::string & rule_id) override;

    void setPlacementRule(const pd::PlacementRule & rule) override;

    void deletePlacementRule(const std::string & group_id, const std::string & rule_id) override;

    void setStoresLabel(const std::vector<uint64_t> & store_ids, const std::string & label_key, const std::string & label_value) override;

    bool isRawKv() const override { return is_raw_kv; }

private:
    struct SplitResponse
    {
        kvrpcpb::SplitRegionResponse resp;
        // the peer that served the successful attempt
        metapb::Peer peer;
    };

    SplitResponse sendSplitRegionRequest(const RegionInfo & region_info, const std::vector<std::string> & keys);

    // Returns the region info the next attempt should use, or nullopt if err
    // can not be retried. Failures met while repairing are appended to split_errors.
    std::optional<RegionInfo> onSplitRegionError(
        const RegionInfo & region_info,
        const errorpb::Error & err,
        MultiException & split_errors,
        int retry_times);

    kvrpcpb::SplitRegionResponse splitRegionWithFailpoint(
        const std::string & addr,
        const RegionInfo & region_info,
        const metapb::Peer & peer,
        const std::vector<std::string> & keys);

    pd::ClientPtr pd_client;

    kv::StoreClientPtr store_client;

    StoreCache store_cache;

    pd::HttpClient http_client;

    const bool is_raw_kv;

    Logger * log;
};

// Connects to the cluster behind pd_addrs. Transactional clusters keep region
// boundaries encoded, so their lookups go through pd::CodecClient.
SplitClientPtr createSplitClient(const std::vector<std::string> & pd_addrs, const ClusterConfig & config);

} // namespace restore
} // namespace brsplit
