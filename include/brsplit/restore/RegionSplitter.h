#pragma once

#include <brsplit/Log.h>
#include <brsplit/kv/Backoff.h>
#include <brsplit/restore/Range.h>
#include <brsplit/restore/SplitClient.h>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace brsplit
{
namespace restore
{
constexpr int splitRetryTimes = 32;
constexpr int scatterWaitMaxRetryTimes = 64;

// RegionSplitter makes the bounds of restored key ranges region boundaries
// and scatters the regions it creates.
class RegionSplitter
{
public:
    // Called with the keys a region was split at, once per split region.
    using OnSplitFunc = std::function<void(const std::vector<std::string> &)>;

    explicit RegionSplitter(SplitClientPtr client_, size_t concurrency_ = 1, bool wait_for_scatter_ = true)
        : client(client_)
        , concurrency(concurrency_ == 0 ? 1 : concurrency_)
        , wait_for_scatter(wait_for_scatter_)
        , log(&Logger::get("brsplit.restore"))
    {}

    void setSplitRetryTimes(int times) { split_retry_times = times; }

    void setScatterWaitTimeout(std::chrono::milliseconds timeout) { scatter_wait_timeout = timeout; }

    // Splits the regions overlapping ranges so every range bound is a region
    // boundary. Regions are handled in ascending key order, distinct regions
    // may be split concurrently. A round that meets errors rescans and
    // retries up to split_retry_times rounds, keys already split are skipped.
    // Returns the regions created, after their scatter finished when
    // wait_for_scatter is set.
    std::vector<RegionInfo> split(const std::vector<KeyRange> & ranges, const OnSplitFunc & on_split = {});

    // Polls the scatter operators of regions until none is running, after
    // scatterWaitMaxRetryTimes polls, or once scatter_wait_timeout elapsed. Returns the number of regions still scattering.
    size_t waitForScatterRegions(const std::vector<RegionInfo> & regions);

    // Whether the scatter of region_id has finished. Transport errors count
    // as unfinished.
    bool isScatterRegionFinished(uint64_t region_id);

private:
    std::vector<RegionInfo> splitAndScatterRegions(const RegionInfo & region_info, const std::vector<std::string> & keys);

    SplitClientPtr client;
    const size_t concurrency;
    const bool wait_for_scatter;
    int split_retry_times = splitRetryTimes;
    std::chrono::milliseconds scatter_wait_timeout{kv::scatterWaitUpperInterval};
    Logger * log;
};

} // namespace restore
} // namespace brsplit
