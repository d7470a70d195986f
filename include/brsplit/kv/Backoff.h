#pragma once

#include <brsplit/Exception.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <memory>
#include <thread>

namespace brsplit
{
namespace kv
{

enum BackoffType
{
    boRegionMiss = 0,
    boSplitRetry,
    boScatterWait,
};

inline int expo(int base, int cap, int n) { return std::min(double(cap), double(base) * std::pow(2.0, double(n))); }

// Backoff sleeps base * 2^attempts ms, capped at cap.
struct Backoff
{
    int base;
    int cap;
    int attempts;

    Backoff(int base_, int cap_) : base(base_), cap(cap_), attempts(0)
    {
        if (base < 2)
        {
            base = 2;
        }
    }

    int sleep()
    {
        int sleep_time = expo(base, cap, attempts);
        std::this_thread::sleep_for(std::chrono::milliseconds(sleep_time));
        attempts++;
        return sleep_time;
    }
};

// Upper bound of the time spent waiting for scattered regions, in ms.
constexpr int scatterWaitUpperInterval = 180000;

using BackoffPtr = std::shared_ptr<Backoff>;

BackoffPtr newBackoff(BackoffType tp);

// Backoffer sleeps with the shape of the given BackoffType and rethrows the
// error once the total sleep exceeds max_sleep (0 means unbounded).
struct Backoffer
{
    std::map<BackoffType, BackoffPtr> backoff_map;
    size_t total_sleep; // ms
    size_t max_sleep;   // ms

    explicit Backoffer(size_t max_sleep_) : total_sleep(0), max_sleep(max_sleep_) {}

    void backoff(BackoffType tp, const Exception & exc);
};

} // namespace kv
} // namespace brsplit
