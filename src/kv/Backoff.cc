#include <brsplit/Exception.h>
#include <brsplit/kv/Backoff.h>

namespace brsplit
{
namespace kv
{
BackoffPtr newBackoff(BackoffType tp)
{
    switch (tp)
    {
    case boRegionMiss:
        return std::make_shared<Backoff>(2, 500);
    case boSplitRetry:
        return std::make_shared<Backoff>(50, 1000);
    case boScatterWait:
        return std::make_shared<Backoff>(50, 1000);
    }
    return nullptr;
}

void Backoffer::backoff(BackoffType tp, const Exception & exc)
{
    if (exc.code() == MismatchClusterIDCode)
    {
        exc.rethrow();
    }

    BackoffPtr bo;
    auto it = backoff_map.find(tp);
    if (it != backoff_map.end())
    {
        bo = it->second;
    }
    else
    {
        bo = newBackoff(tp);
        backoff_map[tp] = bo;
    }
    total_sleep += bo->sleep();
    if (max_sleep > 0 && total_sleep > max_sleep)
    {
        exc.rethrow();
    }
}

} // namespace kv
} // namespace brsplit
