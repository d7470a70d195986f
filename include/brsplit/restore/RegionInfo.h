#pragma once

#include <brsplit/RedactHelpers.h>
#include <kvproto/metapb.pb.h>
#include <kvproto/pdpb.pb.h>

#include <optional>
#include <string>

namespace brsplit
{
namespace restore
{
// RegionInfo is a snapshot of a region and the peer believed to lead it. The
// leader is only a hint for the next request: a leader with id 0 means no
// leader is known.
struct RegionInfo
{
    metapb::Region region;
    metapb::Peer leader;

    RegionInfo() = default;
    RegionInfo(const metapb::Region & region_, const metapb::Peer & leader_)
        : region(region_)
        , leader(leader_)
    {}

    uint64_t id() const { return region.id(); }

    const std::string & startKey() const { return region.start_key(); }

    const std::string & endKey() const { return region.end_key(); }

    bool hasLeader() const { return leader.id() != 0; }

    // True when splitting at key would produce two non-empty regions.
    bool containsInterior(const std::string & key) const { return key > startKey() && (key < endKey() || endKey().empty()); }

    // A copy of this snapshot addressed to another leader.
    RegionInfo withLeader(const metapb::Peer & new_leader) const { return RegionInfo(region, new_leader); }

    std::string toString() const
    {
        std::string s = "{id: " + std::to_string(region.id()) + ", start: " + Redact::keyToDebugString(startKey())
            + ", end: " + Redact::keyToDebugString(endKey()) + ", epoch: {conf_ver: " + std::to_string(region.region_epoch().conf_ver())
            + ", version: " + std::to_string(region.region_epoch().version()) + "}, peers: [";
        for (int i = 0; i < region.peers_size(); i++)
        {
            if (i > 0)
                s += ", ";
            s += std::to_string(region.peers(i).id()) + "@" + std::to_string(region.peers(i).store_id());
        }
        s += "], leader: " + std::to_string(leader.id()) + "@" + std::to_string(leader.store_id()) + "}";
        return s;
    }
};

// checkRegionEpoch returns whether the epoch of `fresh` dominates or equals the
// epoch of `origin`, i.e. `fresh` describes the same region or a later state of it.
inline bool checkRegionEpoch(const RegionInfo & fresh, const RegionInfo & origin)
{
    const auto & fresh_epoch = fresh.region.region_epoch();
    const auto & origin_epoch = origin.region.region_epoch();
    return fresh_epoch.conf_ver() >= origin_epoch.conf_ver() && fresh_epoch.version() >= origin_epoch.version();
}

// Builds a RegionInfo from a metadata-service lookup, nullopt if the region is unknown.
inline std::optional<RegionInfo> toRegionInfo(const pdpb::GetRegionResponse & resp)
{
    if (!resp.has_region() || resp.region().id() == 0)
        return std::nullopt;
    return RegionInfo(resp.region(), resp.leader());
}

} // namespace restore
} // namespace brsplit
