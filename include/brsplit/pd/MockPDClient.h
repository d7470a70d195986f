#pragma once

#include <brsplit/Exception.h>
#include <brsplit/pd/IClient.h>

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace brsplit
{
namespace pd
{
// MockPDClient keeps an in-memory region table with raw keys. Regions are
// indexed by start key and are expected to partition the key space.
class MockPDClient : public IClient
{
public:
    MockPDClient() = default;

    ~MockPDClient() override = default;

    void addStore(uint64_t store_id, const std::string & address)
    {
        std::lock_guard<std::mutex> lock(mu);
        metapb::Store store;
        store.set_id(store_id);
        store.set_address(address);
        stores[store_id] = store;
    }

    void addRegion(const metapb::Region & region, const metapb::Peer & leader)
    {
        std::lock_guard<std::mutex> lock(mu);
        regions[region.start_key()] = Entry{region, leader};
        next_id = std::max(next_id, region.id() + 1);
        for (const auto & peer : region.peers())
            next_id = std::max(next_id, peer.id() + 1);
    }

    void removeRegion(uint64_t region_id)
    {
        std::lock_guard<std::mutex> lock(mu);
        for (auto it = regions.begin(); it != regions.end(); ++it)
        {
            if (it->second.region.id() == region_id)
            {
                regions.erase(it);
                return;
            }
        }
    }

    void setLeader(uint64_t region_id, const metapb::Peer & leader)
    {
        std::lock_guard<std::mutex> lock(mu);
        if (auto * entry = findByID(region_id))
            entry->leader = leader;
    }

    // Splits region_id at keys, which must be ascending and inside the region.
    // The left-most child keeps the id unless right_derive is set. Every child
    // gets its peers on the stores of the split region.
    std::vector<metapb::Region> splitRegion(uint64_t region_id, const std::vector<std::string> & keys)
    {
        std::lock_guard<std::mutex> lock(mu);
        auto * entry = findByID(region_id);
        if (entry == nullptr)
            throw Exception("region " + std::to_string(region_id) + " not found", RegionNotFound);
        const metapb::Region origin = entry->region;
        const metapb::Peer origin_leader = entry->leader;
        regions.erase(origin.start_key());

        std::vector<std::string> bounds;
        bounds.push_back(origin.start_key());
        bounds.insert(bounds.end(), keys.begin(), keys.end());
        bounds.push_back(origin.end_key());

        std::vector<metapb::Region> children;
        const size_t derived = right_derive ? keys.size() : 0;
        for (size_t i = 0; i + 1 < bounds.size(); i++)
        {
            metapb::Region child;
            child.set_start_key(bounds[i]);
            child.set_end_key(bounds[i + 1]);
            child.mutable_region_epoch()->set_conf_ver(origin.region_epoch().conf_ver());
            child.mutable_region_epoch()->set_version(origin.region_epoch().version() + keys.size());
            metapb::Peer leader;
            if (i == derived)
            {
                child.set_id(origin.id());
                *child.mutable_peers() = origin.peers();
                leader = origin_leader;
            }
            else
            {
                child.set_id(next_id++);
                for (const auto & peer : origin.peers())
                {
                    auto * new_peer = child.add_peers();
                    new_peer->set_id(next_id++);
                    new_peer->set_store_id(peer.store_id());
                    if (peer.store_id() == origin_leader.store_id())
                        leader = *new_peer;
                }
            }
            regions[child.start_key()] = Entry{child, leader};
            children.push_back(child);
        }
        return children;
    }

    void setOperator(uint64_t region_id, pdpb::OperatorStatus status, const std::string & desc = "scatter-region")
    {
        std::lock_guard<std::mutex> lock(mu);
        operators[region_id] = std::make_pair(status, desc);
    }

    void setLeaderUrl(const std::string & url)
    {
        std::lock_guard<std::mutex> lock(mu);
        leader_url = url;
    }

    size_t regionCount()
    {
        std::lock_guard<std::mutex> lock(mu);
        return regions.size();
    }

    pdpb::GetRegionResponse getRegionByKey(const std::string & key) override
    {
        std::lock_guard<std::mutex> lock(mu);
        pdpb::GetRegionResponse resp;
        auto it = findByKey(key);
        if (it != regions.end())
        {
            *resp.mutable_region() = it->second.region;
            *resp.mutable_leader() = it->second.leader;
        }
        return resp;
    }

    pdpb::GetRegionResponse getRegionByID(uint64_t region_id) override
    {
        get_region_by_id_calls++;
        return peekRegion(region_id);
    }

    // getRegionByID without counting the call.
    pdpb::GetRegionResponse peekRegion(uint64_t region_id)
    {
        std::lock_guard<std::mutex> lock(mu);
        pdpb::GetRegionResponse resp;
        if (auto * entry = findByID(region_id))
        {
            *resp.mutable_region() = entry->region;
            *resp.mutable_leader() = entry->leader;
        }
        return resp;
    }

    pdpb::ScanRegionsResponse scanRegions(const std::string & start_key, const std::string & end_key, int limit) override
    {
        scan_regions_calls++;
        std::lock_guard<std::mutex> lock(mu);
        pdpb::ScanRegionsResponse resp;
        auto it = findByKey(start_key);
        if (it == regions.end())
            it = regions.lower_bound(start_key);
        for (; it != regions.end() && resp.regions_size() < limit; ++it)
        {
            if (!end_key.empty() && it->first >= end_key)
                break;
            auto * region = resp.add_regions();
            *region->mutable_region() = it->second.region;
            *region->mutable_leader() = it->second.leader;
        }
        return resp;
    }

    metapb::Store getStore(uint64_t store_id) override
    {
        get_store_calls++;
        std::lock_guard<std::mutex> lock(mu);
        auto it = stores.find(store_id);
        if (it == stores.end())
            throw Exception("store " + std::to_string(store_id) + " not found", PDServerError);
        return it->second;
    }

    void scatterRegion(uint64_t region_id) override
    {
        scatter_calls++;
        std::lock_guard<std::mutex> lock(mu);
        if (findByID(region_id) == nullptr)
            throw Exception("region " + std::to_string(region_id) + " not found", RegionNotFound);
        if (operators.find(region_id) == operators.end())
            operators[region_id] = std::make_pair(pdpb::OperatorStatus::SUCCESS, std::string("scatter-region"));
    }

    pdpb::GetOperatorResponse getOperator(uint64_t region_id) override
    {
        get_operator_calls++;
        std::lock_guard<std::mutex> lock(mu);
        pdpb::GetOperatorResponse resp;
        auto it = operators.find(region_id);
        if (it == operators.end())
        {
            resp.mutable_header()->mutable_error()->set_type(pdpb::ErrorType::REGION_NOT_FOUND);
            resp.mutable_header()->mutable_error()->set_message("Not Found");
            return resp;
        }
        resp.set_region_id(region_id);
        resp.set_status(it->second.first);
        resp.set_desc(it->second.second);
        // A running operator finishes after it was observed once.
        if (it->second.first == pdpb::OperatorStatus::RUNNING && finish_running_operators)
            it->second.first = pdpb::OperatorStatus::SUCCESS;
        return resp;
    }

    std::string getLeaderUrl() override
    {
        std::lock_guard<std::mutex> lock(mu);
        return leader_url;
    }

    bool right_derive = false;
    bool finish_running_operators = true;

    std::atomic<int> get_store_calls{0};
    std::atomic<int> get_region_by_id_calls{0};
    std::atomic<int> scan_regions_calls{0};
    std::atomic<int> scatter_calls{0};
    std::atomic<int> get_operator_calls{0};

private:
    struct Entry
    {
        metapb::Region region;
        metapb::Peer leader;
    };

    std::map<std::string, Entry>::iterator findByKey(const std::string & key)
    {
        auto it = regions.upper_bound(key);
        if (it == regions.begin())
            return regions.end();
        --it;
        const auto & end_key = it->second.region.end_key();
        if (!end_key.empty() && key >= end_key)
            return regions.end();
        return it;
    }

    Entry * findByID(uint64_t region_id)
    {
        for (auto & [start_key, entry] : regions)
        {
            if (entry.region.id() == region_id)
                return &entry;
        }
        return nullptr;
    }

    std::mutex mu;
    std::map<std::string, Entry> regions;
    std::map<uint64_t, metapb::Store> stores;
    std::map<uint64_t, std::pair<pdpb::OperatorStatus, std::string>> operators;
    std::string leader_url;
    uint64_t next_id = 1;
};

using MockPDClientPtr = std::shared_ptr<MockPDClient>;

} // namespace pd
} // namespace brsplit
