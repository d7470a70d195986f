#include <brsplit/Exception.h>
#include <brsplit/RedactHelpers.h>
#include <brsplit/restore/Range.h>
#include <brsplit/restore/SplitClient.h>

#include <algorithm>
#include <set>

namespace brsplit
{
namespace restore
{
std::string KeyRange::toString() const
{
    return "[" + Redact::keyToDebugString(start_key) + ", " + Redact::keyToDebugString(end_key) + ")";
}

std::vector<KeyRange> validateFileRanges(const std::vector<File> & files)
{
    std::vector<KeyRange> ranges;
    for (const auto & file : files)
    {
        if (!file.end_key.empty() && file.start_key > file.end_key)
            throw Exception("file " + file.name + " has an invalid range " + KeyRange(file.start_key, file.end_key).toString(), InvalidRange);
        KeyRange range(file.start_key, file.end_key);
        range.files.push_back(file);
        ranges.push_back(std::move(range));
    }
    return sortRanges(ranges);
}

std::vector<KeyRange> sortRanges(const std::vector<KeyRange> & ranges)
{
    // start key -> range, identical ranges are merged
    std::map<std::string, KeyRange> sorted;
    for (const auto & range : ranges)
    {
        if (!range.end_key.empty() && range.start_key > range.end_key)
            throw Exception("invalid range " + range.toString(), InvalidRange);
        auto it = sorted.find(range.start_key);
        if (it == sorted.end())
        {
            sorted.emplace(range.start_key, range);
            continue;
        }
        if (it->second.end_key != range.end_key)
            throw Exception("ranges overlapped: " + it->second.toString() + " and " + range.toString(), InvalidRange);
        auto & files = it->second.files;
        files.insert(files.end(), range.files.begin(), range.files.end());
    }

    std::vector<KeyRange> res;
    res.reserve(sorted.size());
    for (auto & [start_key, range] : sorted)
    {
        if (!res.empty())
        {
            const auto & prev = res.back();
            if (prev.end_key.empty() || range.start_key < prev.end_key)
                throw Exception("ranges overlapped: " + prev.toString() + " and " + range.toString(), InvalidRange);
        }
        res.push_back(std::move(range));
    }
    return res;
}

void checkRegionConsistency(const std::string & start_key, const std::string & end_key, const std::vector<RegionInfo> & regions)
{
    if (regions.empty())
        throw Exception("scan region return empty result, startKey: " + Redact::keyToDebugString(start_key) + ", endKey: " + Redact::keyToDebugString(end_key), RegionUnavailable);

    if (regions.front().startKey() > start_key)
        throw Exception("first region's startKey > startKey, startKey: " + Redact::keyToDebugString(start_key)
                            + ", regionStartKey: " + Redact::keyToDebugString(regions.front().startKey()),
                        RegionUnavailable);

    const auto & last_end_key = regions.back().endKey();
    if (!last_end_key.empty() && (end_key.empty() || last_end_key < end_key))
        throw Exception("last region's endKey < endKey, endKey: " + Redact::keyToDebugString(end_key)
                            + ", regionEndKey: " + Redact::keyToDebugString(last_end_key),
                        RegionUnavailable);

    for (size_t i = 1; i < regions.size(); i++)
    {
        if (regions[i - 1].endKey() != regions[i].startKey())
            throw Exception("region endKey not equal to next region startKey, endKey: " + Redact::keyToDebugString(regions[i - 1].endKey())
                                + ", startKey: " + Redact::keyToDebugString(regions[i].startKey()),
                            RegionUnavailable);
    }
}

std::vector<RegionInfo> paginateScanRegion(ISplitClient & client, const std::string & start_key, const std::string & end_key, int limit)
{
    if (!end_key.empty() && start_key > end_key)
        throw Exception("startKey > endKey, startKey: " + Redact::keyToDebugString(start_key) + ", endKey: " + Redact::keyToDebugString(end_key), InvalidRange);

    std::vector<RegionInfo> regions;
    std::string scan_start_key = start_key;
    for (;;)
    {
        auto batch = client.scanRegions(scan_start_key, end_key, limit);
        if (batch.empty())
            break;
        regions.insert(regions.end(), batch.begin(), batch.end());
        scan_start_key = regions.back().endKey();
        if (scan_start_key.empty() || (!end_key.empty() && scan_start_key >= end_key))
            break;
    }
    checkRegionConsistency(start_key, end_key, regions);
    return regions;
}

const RegionInfo * needSplit(const std::string & split_key, const std::vector<RegionInfo> & regions)
{
    if (split_key.empty())
        return nullptr;
    for (const auto & region : regions)
    {
        // already a boundary
        if (split_key == region.startKey())
            return nullptr;
        if (region.containsInterior(split_key))
            return &region;
    }
    return nullptr;
}

std::map<uint64_t, std::vector<std::string>> getSplitKeys(const std::vector<KeyRange> & ranges, const std::vector<RegionInfo> & regions)
{
    std::map<uint64_t, std::set<std::string>> key_sets;
    for (const auto & range : ranges)
    {
        for (const auto * key : {&range.start_key, &range.end_key})
        {
            if (const auto * region = needSplit(*key, regions))
                key_sets[region->id()].insert(*key);
        }
    }

    std::map<uint64_t, std::vector<std::string>> split_keys;
    for (auto & [region_id, keys] : key_sets)
        split_keys.emplace(region_id, std::vector<std::string>(keys.begin(), keys.end()));
    return split_keys;
}

} // namespace restore
} // namespace brsplit
