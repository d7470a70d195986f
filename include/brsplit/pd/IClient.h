#pragma once

#include <memory>
#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#include <kvproto/metapb.pb.h>
#include <kvproto/pdpb.pb.h>
#pragma GCC diagnostic pop

namespace brsplit
{
namespace pd
{
// IClient is the metadata-service capability set the restore core depends on.
// Lookups that find nothing return a response whose region is not set, other
// failures throw.
class IClient
{
public:
    virtual ~IClient() = default;

    virtual pdpb::GetRegionResponse getRegionByKey(const std::string & key) = 0;

    virtual pdpb::GetRegionResponse getRegionByID(uint64_t region_id) = 0;

    // The result always carries `regions`, even if the server only filled the
    // legacy region_metas/leaders fields.
    virtual pdpb::ScanRegionsResponse scanRegions(const std::string & start_key, const std::string & end_key, int limit) = 0;

    virtual metapb::Store getStore(uint64_t store_id) = 0;

    virtual void scatterRegion(uint64_t region_id) = 0;

    virtual pdpb::GetOperatorResponse getOperator(uint64_t region_id) = 0;

    // Client url of the current PD leader, empty when unknown.
    virtual std::string getLeaderUrl() = 0;
};

using ClientPtr = std::shared_ptr<IClient>;

} // namespace pd
} // namespace brsplit
