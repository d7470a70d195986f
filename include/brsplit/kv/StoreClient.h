#pragma once

#include <brsplit/Config.h>
#include <brsplit/Log.h>
#include <kvproto/kvrpcpb.pb.h>

#include <memory>
#include <string>

namespace brsplit
{
namespace kv
{
constexpr int splitRegionTimeout = 60;

// IStoreClient sends requests to a single storage node.
class IStoreClient
{
public:
    virtual ~IStoreClient() = default;

    // Throws on transport failure. Region errors come back inside the response.
    virtual kvrpcpb::SplitRegionResponse splitRegion(const std::string & addr, const kvrpcpb::SplitRegionRequest & req) = 0;
};

using StoreClientPtr = std::shared_ptr<IStoreClient>;

// StoreClient dials a new connection for every request and drops it before
// returning, there is no pooling at this layer.
class StoreClient : public IStoreClient
{
public:
    explicit StoreClient(const ClusterConfig & config_, int timeout_ = splitRegionTimeout)
        : config(config_)
        , timeout(timeout_)
        , log(&Logger::get("brsplit.tikv"))
    {}

    kvrpcpb::SplitRegionResponse splitRegion(const std::string & addr, const kvrpcpb::SplitRegionRequest & req) override;

private:
    const ClusterConfig config;
    const int timeout;
    Logger * log;
};

} // namespace kv
} // namespace brsplit
