#pragma once

#include <Poco/Logger.h>

namespace brsplit
{
using Logger = Poco::Logger;
} // namespace brsplit
