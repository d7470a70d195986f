#include <brsplit/Exception.h>
#include <brsplit/common/FixedThreadPool.h>
#include <brsplit/kv/Backoff.h>
#include <brsplit/restore/RegionSplitter.h>

#include <chrono>
#include <mutex>

namespace brsplit
{
namespace restore
{
constexpr int splitCheckMaxRetryTimes = 64;

std::vector<RegionInfo> RegionSplitter::split(const std::vector<KeyRange> & ranges, const OnSplitFunc & on_split)
{
    if (ranges.empty())
    {
        log->information("skip split regions, no range");
        return {};
    }
    auto start_time = std::chrono::steady_clock::now();

    auto sorted_ranges = sortRanges(ranges);
    const std::string min_key = sorted_ranges.front().start_key;
    const std::string max_key = sorted_ranges.back().end_key;

    std::mutex mu;
    std::vector<RegionInfo> scatter_regions;
    kv::Backoffer bo(0);
    for (int i = 0;; i++)
    {
        MultiException round_errors;
        std::vector<RegionInfo> regions;
        try
        {
            regions = paginateScanRegion(*client, min_key, max_key, scanRegionPaginationLimit);
        }
        catch (const Exception & e)
        {
            round_errors.append(e);
        }

        if (round_errors.size() == 0)
        {
            auto split_key_map = getSplitKeys(sorted_ranges, regions);
            common::FixedThreadPool pool(concurrency, "RegionSplitter");
            pool.start();
            // regions are in ascending key order
            for (const auto & region : regions)
            {
                auto it = split_key_map.find(region.id());
                if (it == split_key_map.end())
                    continue;
                pool.enqueue([&, region, keys = it->second]() {
                    try
                    {
                        auto new_regions = splitAndScatterRegions(region, keys);
                        std::lock_guard<std::mutex> lock(mu);
                        scatter_regions.insert(scatter_regions.end(), new_regions.begin(), new_regions.end());
                        if (on_split)
                            on_split(keys);
                    }
                    catch (const Exception & e)
                    {
                        log->warning("split regions failed, region: " + region.toString() + ", error: " + e.displayText());
                        std::lock_guard<std::mutex> lock(mu);
                        round_errors.append(e);
                    }
                    catch (...)
                    {
                        auto msg = getCurrentExceptionMsg("split regions failed: ");
                        log->warning(msg);
                        std::lock_guard<std::mutex> lock(mu);
                        round_errors.append(Exception(msg, SplitFailed));
                    }
                });
            }
            pool.stop();
        }

        if (round_errors.size() == 0)
            break;
        if (i + 1 >= split_retry_times)
        {
            log->error("split regions failed after " + std::to_string(split_retry_times) + " rounds: " + round_errors.displayText());
            throw round_errors;
        }
        log->warning("split regions failed, retry round " + std::to_string(i + 1) + ": " + round_errors.displayText());
        bo.backoff(kv::boSplitRetry, round_errors);
    }

    auto split_cost = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count();
    log->information("split regions done, ranges: " + std::to_string(sorted_ranges.size()) + ", new regions: "
                     + std::to_string(scatter_regions.size()) + ", cost: " + std::to_string(split_cost) + "ms");

    if (wait_for_scatter && !scatter_regions.empty())
    {
        auto scatter_start = std::chrono::steady_clock::now();
        auto unfinished = waitForScatterRegions(scatter_regions);
        auto scatter_cost = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - scatter_start).count();
        log->information("waiting for scattering regions done, regions: " + std::to_string(scatter_regions.size())
                         + ", unfinished: " + std::to_string(unfinished) + ", cost: " + std::to_string(scatter_cost) + "ms");
    }
    return scatter_regions;
}

std::vector<RegionInfo> RegionSplitter::splitAndScatterRegions(const RegionInfo & region_info, const std::vector<std::string> & keys)
{
    auto new_regions = client->batchSplitRegions(region_info, keys);
    for (const auto & region : new_regions)
    {
        // Wait for a while until the regions successfully split.
        auto backoff = kv::newBackoff(kv::boRegionMiss);
        bool ready = false;
        for (int i = 0; i < splitCheckMaxRetryTimes && !ready; i++)
        {
            try
            {
                ready = client->getRegionByID(region.id()).has_value();
            }
            catch (const Exception & e)
            {
                log->warning("check split region " + std::to_string(region.id()) + " failed: " + e.displayText());
            }
            if (!ready)
                backoff->sleep();
        }
        if (!ready)
            log->warning("region " + std::to_string(region.id()) + " is still not found after split");

        // Scatter is best effort, an unscattered region only hurts balance.
        try
        {
            client->scatterRegion(region);
        }
        catch (const Exception & e)
        {
            log->warning("scatter region failed, region: " + region.toString() + ", error: " + e.displayText());
        }
    }
    return new_regions;
}

bool RegionSplitter::isScatterRegionFinished(uint64_t region_id)
{
    pdpb::GetOperatorResponse resp;
    try
    {
        resp = client->getOperator(region_id);
    }
    catch (const Exception & e)
    {
        log->warning("get operator of region " + std::to_string(region_id) + " failed: " + e.displayText());
        return false;
    }
    if (resp.header().has_error() && resp.header().error().type() != pdpb::ErrorType::OK)
    {
        // no operator for the region, or the region is merged away
        if (resp.header().error().type() == pdpb::ErrorType::REGION_NOT_FOUND)
            return true;
        log->warning("get operator of region " + std::to_string(region_id) + " failed: " + resp.header().error().message());
        return false;
    }
    // Another operator replaced the scatter, or the scatter is over.
    return resp.desc() != "scatter-region" || resp.status() != pdpb::OperatorStatus::RUNNING;
}

size_t RegionSplitter::waitForScatterRegions(const std::vector<RegionInfo> & regions)
{
    std::vector<uint64_t> pending;
    pending.reserve(regions.size());
    for (const auto & region : regions)
        pending.push_back(region.id());

    auto backoff = kv::newBackoff(kv::boScatterWait);
    const auto deadline = std::chrono::steady_clock::now() + scatter_wait_timeout;
    for (int i = 0; i < scatterWaitMaxRetryTimes; i++)
    {
        std::vector<uint64_t> still_running;
        for (auto region_id : pending)
        {
            if (!isScatterRegionFinished(region_id))
                still_running.push_back(region_id);
        }
        pending.swap(still_running);
        if (pending.empty())
            return 0;
        // wall clock, polls included
        if (std::chrono::steady_clock::now() >= deadline)
            break;
        backoff->sleep();
    }
    log->warning("wait for scatter region timeout, regions still scattering: " + std::to_string(pending.size()));
    return pending.size();
}

} // namespace restore
} // namespace brsplit
