#pragma once

#include <brsplit/restore/RegionInfo.h>

#include <map>
#include <string>
#include <vector>

namespace brsplit
{
namespace restore
{
class ISplitClient;

constexpr int scanRegionPaginationLimit = 128;

// File is a backup file covering [start_key, end_key). An empty end key means
// the file reaches the end of the key space.
struct File
{
    std::string name;
    std::string start_key;
    std::string end_key;
    uint64_t total_kvs = 0;
    uint64_t total_bytes = 0;
};

// KeyRange is a key range to restore and the files covering it.
struct KeyRange
{
    std::string start_key;
    std::string end_key;
    std::vector<File> files;

    KeyRange() = default;
    KeyRange(const std::string & start_key_, const std::string & end_key_)
        : start_key(start_key_)
        , end_key(end_key_)
    {}

    std::string toString() const;
};

// Groups files by their range. Throws InvalidRange if a file starts after it
// ends, or if two distinct ranges overlap.
std::vector<KeyRange> validateFileRanges(const std::vector<File> & files);

// Returns ranges sorted by start key. Throws InvalidRange on overlap. Ranges
// with identical bounds are merged.
std::vector<KeyRange> sortRanges(const std::vector<KeyRange> & ranges);

// Scans all regions overlapping [start_key, end_key), limit regions per call,
// and checks that they cover the range without holes.
std::vector<RegionInfo> paginateScanRegion(ISplitClient & client, const std::string & start_key, const std::string & end_key, int limit);

// Throws RegionUnavailable unless regions are adjacent and cover [start_key, end_key).
void checkRegionConsistency(const std::string & start_key, const std::string & end_key, const std::vector<RegionInfo> & regions);

// Returns the region that must be split at split_key, or nullptr if the key is
// empty, already a region boundary, or outside the regions.
const RegionInfo * needSplit(const std::string & split_key, const std::vector<RegionInfo> & regions);

// Maps region id to the ascending, deduplicated keys that must split it so
// that every range bound becomes a region boundary.
std::map<uint64_t, std::vector<std::string>> getSplitKeys(const std::vector<KeyRange> & ranges, const std::vector<RegionInfo> & regions);

} // namespace restore
} // namespace brsplit
