#pragma once

#include <atomic>
#include <string>

namespace brsplit
{
enum class RedactMode
{
    Disable,
    Enable,
    Marker,
};

class Redact
{
public:
    static void setRedactLog(RedactMode v);

    // Format a user key for logging. The key becomes '?' when redaction is enabled.
    static std::string keyToDebugString(const char * key, size_t size);
    static std::string keyToDebugString(const std::string & key) { return Redact::keyToDebugString(key.data(), key.size()); }

    // Upper case hex, as accepted by the placement rule API.
    static std::string keyToHexString(const char * key, size_t size);
    static std::string keyToHexString(const std::string & key) { return Redact::keyToHexString(key.data(), key.size()); }

    // Inverse of keyToHexString, accepts both cases. Throws on malformed input.
    static std::string hexStringToKey(const std::string & hex);

protected:
    Redact() = default;

private:
    // Log user data to log only when this flag is set to false.
    static std::atomic<RedactMode> REDACT_LOG;
};

} // namespace brsplit
