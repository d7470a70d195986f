#include <brsplit/Exception.h>
#include <brsplit/restore/StoreCache.h>

namespace brsplit
{
namespace restore
{
metapb::Store StoreCache::getStore(uint64_t store_id)
{
    std::lock_guard<std::mutex> lock(store_mutex);
    auto it = stores.find(store_id);
    if (it != stores.end())
        return it->second;

    auto store = pd_client->getStore(store_id);
    if (store.id() == 0)
        throw Exception("store " + std::to_string(store_id) + " not found", RegionUnavailable);
    log->debug("load store id: " + std::to_string(store_id) + " address: " + store.address());
    stores[store_id] = store;
    return store;
}

size_t StoreCache::size()
{
    std::lock_guard<std::mutex> lock(store_mutex);
    return stores.size();
}

} // namespace restore
} // namespace brsplit
