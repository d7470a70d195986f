#include <brsplit/RedactHelpers.h>
#include <brsplit/pd/CodecClient.h>
#include <brsplit/restore/SplitClient.h>
#include <fiu-local.h>

namespace brsplit
{
namespace restore
{
namespace
{
int regionErrorCode(const errorpb::Error & err)
{
    if (err.has_not_leader())
        return NotLeader;
    if (err.has_server_is_busy())
        return ServerIsBusy;
    if (err.has_stale_command())
        return StaleCommand;
    if (err.has_region_not_found())
        return RegionNotFound;
    if (err.has_epoch_not_match())
        return RegionEpochNotMatch;
    if (err.has_key_not_in_region())
        return KeyNotInRegion;
    return SplitFailed;
}

std::string keysToDebugString(const std::vector<std::string> & keys)
{
    std::string s = "[";
    for (size_t i = 0; i < keys.size(); i++)
    {
        if (i > 0)
            s += ", ";
        s += Redact::keyToDebugString(keys[i]);
    }
    return s + "]";
}
} // namespace

SplitClient::SplitClient(pd::ClientPtr pd_client_, kv::StoreClientPtr store_client_, const ClusterConfig & config)
    : pd_client(pd_client_)
    , store_client(store_client_)
    , store_cache(pd_client_)
    , http_client(pd_client_, config)
    , is_raw_kv(config.isRawKv())
    , log(&Logger::get("brsplit.restore"))
{}

metapb::Store SplitClient::getStore(uint64_t store_id)
{
    return store_cache.getStore(store_id);
}

std::optional<RegionInfo> SplitClient::getRegion(const std::string & key)
{
    return toRegionInfo(pd_client->getRegionByKey(key));
}

std::optional<RegionInfo> SplitClient::getRegionByID(uint64_t region_id)
{
    return toRegionInfo(pd_client->getRegionByID(region_id));
}

std::vector<RegionInfo> SplitClient::scanRegions(const std::string & key, const std::string & end_key, int limit)
{
    auto resp = pd_client->scanRegions(key, end_key, limit);
    std::vector<RegionInfo> region_infos;
    region_infos.reserve(resp.regions_size());
    for (const auto & region : resp.regions())
        region_infos.emplace_back(region.region(), region.leader());
    return region_infos;
}

kvrpcpb::SplitRegionResponse SplitClient::splitRegionWithFailpoint(
    const std::string & addr,
    const RegionInfo & region_info,
    const metapb::Peer & peer,
    const std::vector<std::string> & keys)
{
    fiu_do_on("split_region_not_leader_error", {
        log->debug("failpoint split_region_not_leader_error injected.");
        kvrpcpb::SplitRegionResponse resp;
        resp.mutable_region_error()->mutable_not_leader()->set_region_id(region_info.id());
        return resp;
    });
    fiu_do_on("split_region_not_leader_error_with_leader", {
        log->debug("failpoint split_region_not_leader_error_with_leader injected.");
        kvrpcpb::SplitRegionResponse resp;
        auto * not_leader = resp.mutable_region_error()->mutable_not_leader();
        not_leader->set_region_id(region_info.id());
        *not_leader->mutable_leader() = region_info.leader;
        return resp;
    });
    fiu_do_on("split_region_server_is_busy", {
        log->debug("failpoint split_region_server_is_busy injected.");
        kvrpcpb::SplitRegionResponse resp;
        resp.mutable_region_error()->mutable_server_is_busy();
        return resp;
    });

    kvrpcpb::SplitRegionRequest req;
    auto * context = req.mutable_context();
    context->set_region_id(region_info.id());
    *context->mutable_region_epoch() = region_info.region.region_epoch();
    *context->mutable_peer() = peer;
    for (const auto & key : keys)
        req.add_split_keys(key);
    req.set_is_raw_kv(is_raw_kv);
    return store_client->splitRegion(addr, req);
}

SplitClient::SplitResponse SplitClient::sendSplitRegionRequest(const RegionInfo & origin, const std::vector<std::string> & keys)
{
    MultiException split_errors;
    RegionInfo region_info = origin;
    for (int i = 0; i < splitRegionMaxRetryTime; i++)
    {
        metapb::Peer peer;
        // scanRegions may return a leader with id 0, which means the leader is unknown.
        if (region_info.hasLeader())
        {
            peer = region_info.leader;
        }
        else
        {
            if (region_info.region.peers_size() == 0)
            {
                split_errors.append(Exception("region[" + std::to_string(region_info.id()) + "] doesn't have any peer", NoPeer));
                throw split_errors;
            }
            peer = region_info.region.peers(0);
        }

        kvrpcpb::SplitRegionResponse resp;
        try
        {
            auto store = store_cache.getStore(peer.store_id());
            resp = splitRegionWithFailpoint(store.address(), region_info, peer, keys);
        }
        catch (const Exception & e)
        {
            split_errors.append(e);
            throw split_errors;
        }

        if (!resp.has_region_error())
            return SplitResponse{std::move(resp), peer};

        const auto & region_error = resp.region_error();
        log->error("fail to split region " + region_info.toString() + ", regionErr: " + region_error.ShortDebugString());
        split_errors.append(Exception("split region failed: err=" + region_error.ShortDebugString(), regionErrorCode(region_error)));

        auto next = onSplitRegionError(region_info, region_error, split_errors, i);
        if (!next)
            throw split_errors;
        region_info = std::move(*next);
    }
    throw split_errors;
}

std::optional<RegionInfo> SplitClient::onSplitRegionError(
    const RegionInfo & region_info,
    const errorpb::Error & err,
    MultiException & split_errors,
    int retry_times)
{
    if (err.has_not_leader())
    {
        const auto & not_leader = err.not_leader();
        std::optional<RegionInfo> next;
        if (not_leader.has_leader() && not_leader.leader().id() != 0)
        {
            next = region_info.withLeader(not_leader.leader());
        }
        else
        {
            uint64_t region_id = not_leader.region_id() != 0 ? not_leader.region_id() : region_info.id();
            try
            {
                next = getRegionByID(region_id);
            }
            catch (const Exception & e)
            {
                split_errors.append(e);
                return std::nullopt;
            }
            if (!next)
            {
                split_errors.append(Exception("region " + std::to_string(region_id) + " not found when finding its new leader", RegionNotFound));
                return std::nullopt;
            }
            if (!checkRegionEpoch(*next, region_info))
            {
                split_errors.append(Exception("epoch not match, region " + region_info.toString() + " is now " + next->toString(), RegionEpochNotMatch));
                return std::nullopt;
            }
            log->information("find new leader " + std::to_string(next->leader.id()) + " of region " + std::to_string(region_id));
        }
        log->information("split region meet not leader error, retrying, retry times: " + std::to_string(retry_times)
                         + ", region: " + next->toString());
        return next;
    }
    // Other errors, like RegionNotFound or EpochNotMatch, do not carry enough
    // information to build a better request, the caller has to rescan.
    if (err.has_server_is_busy() || err.has_stale_command())
    {
        log->warning("a error occurs on split region, retry times: " + std::to_string(retry_times) + ", region id: "
                     + std::to_string(region_info.id()) + ", error: " + err.message());
        return region_info;
    }
    return std::nullopt;
}

SplitResult SplitClient::batchSplitRegionsWithOrigin(const RegionInfo & region_info, const std::vector<std::string> & keys)
{
    auto split_resp = sendSplitRegionRequest(region_info, keys);

    SplitResult result;
    result.new_regions.reserve(split_resp.resp.regions_size());
    for (auto region : split_resp.resp.regions())
    {
        if (!is_raw_kv)
            pd::CodecClient::processRegionResult(region);

        // Assume the leaders will be at the same store.
        metapb::Peer leader;
        for (const auto & p : region.peers())
        {
            if (p.store_id() == split_resp.peer.store_id())
            {
                leader = p;
                break;
            }
        }
        if (region.id() == region_info.id())
        {
            result.origin = RegionInfo(region, leader);
            continue;
        }
        result.new_regions.emplace_back(region, leader);
    }
    log->information("split region " + std::to_string(region_info.id()) + " at " + keysToDebugString(keys) + " into "
                     + std::to_string(split_resp.resp.regions_size()) + " regions");
    return result;
}

std::vector<RegionInfo> SplitClient::batchSplitRegions(const RegionInfo & region_info, const std::vector<std::string> & keys)
{
    return batchSplitRegionsWithOrigin(region_info, keys).new_regions;
}

std::optional<RegionInfo> SplitClient::splitRegion(const RegionInfo & region_info, const std::string & key)
{
    if (!region_info.containsInterior(key))
        return std::nullopt;

    auto result = batchSplitRegionsWithOrigin(region_info, {key});
    if (result.origin && result.origin->startKey() == region_info.startKey())
        return result.origin;
    for (auto & region : result.new_regions)
    {
        if (region.startKey() == region_info.startKey())
            return region;
    }
    throw Exception("split region " + region_info.toString() + " succeeded, but no region starts at its start key", SplitFailed);
}

void SplitClient::scatterRegion(const RegionInfo & region_info)
{
    pd_client->scatterRegion(region_info.id());
}

pdpb::GetOperatorResponse SplitClient::getOperator(uint64_t region_id)
{
    return pd_client->getOperator(region_id);
}

pd::PlacementRule SplitClient::getPlacementRule(const std::string & group_id, const std::string & rule_id)
{
    return http_client.getPlacementRule(group_id, rule_id);
}

void SplitClient::setPlacementRule(const pd::PlacementRule & rule)
{
    http_client.setPlacementRule(rule);
}

void SplitClient::deletePlacementRule(const std::string & group_id, const std::string & rule_id)
{
    http_client.deletePlacementRule(group_id, rule_id);
}

void SplitClient::setStoresLabel(const std::vector<uint64_t> & store_ids, const std::string & label_key, const std::string & label_value)
{
    http_client.setStoresLabel(store_ids, label_key, label_value);
}

SplitClientPtr createSplitClient(const std::vector<std::string> & pd_addrs, const ClusterConfig & config)
{
    pd::ClientPtr pd_client;
    if (config.isRawKv())
        pd_client = std::make_shared<pd::Client>(pd_addrs, config);
    else
        pd_client = std::make_shared<pd::CodecClient>(pd_addrs, config);
    return std::make_shared<SplitClient>(pd_client, std::make_shared<kv::StoreClient>(config), config);
}

} // namespace restore
} // namespace brsplit
