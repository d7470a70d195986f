#pragma once

#include <brsplit/Log.h>
#include <brsplit/pd/IClient.h>
#include <kvproto/metapb.pb.h>

#include <map>
#include <mutex>

namespace brsplit
{
namespace restore
{
// StoreCache remembers store metadata for the lifetime of the client. Entries
// are never invalidated; a moved store keeps its stale address until the
// client is recreated.
class StoreCache
{
public:
    explicit StoreCache(pd::ClientPtr pd_client_)
        : pd_client(pd_client_)
        , log(&Logger::get("brsplit.restore"))
    {}

    // Returns the cached store or fetches it from the metadata service.
    // Fetch errors propagate and leave the cache untouched.
    metapb::Store getStore(uint64_t store_id);

    size_t size();

private:
    pd::ClientPtr pd_client;

    std::mutex store_mutex;

    std::map<uint64_t, metapb::Store> stores;

    Logger * log;
};

} // namespace restore
} // namespace brsplit
