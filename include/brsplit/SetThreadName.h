#pragma once

#include <pthread.h>

#include <string>

namespace brsplit
{
// Linux limits thread names to 15 characters plus the terminating zero.
inline void SetThreadName(const std::string & name)
{
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
}

} // namespace brsplit
