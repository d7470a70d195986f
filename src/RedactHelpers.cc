#include <brsplit/Exception.h>
#include <brsplit/RedactHelpers.h>
#include <string.h>

namespace brsplit
{

std::atomic<RedactMode> Redact::REDACT_LOG = RedactMode::Disable;

void Redact::setRedactLog(RedactMode v)
{
    Redact::REDACT_LOG.store(v, std::memory_order_relaxed);
}

constexpr auto hex_digits_uppercase = "0123456789ABCDEF";

std::string Redact::keyToHexString(const char * key, size_t size)
{
    std::string buf(size * 2, '\0');
    for (size_t i = 0; i < size; ++i)
    {
        auto byte = static_cast<uint8_t>(key[i]);
        buf[i * 2] = hex_digits_uppercase[byte >> 4];
        buf[i * 2 + 1] = hex_digits_uppercase[byte & 0x0f];
    }
    return buf;
}

namespace
{
int hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
} // namespace

std::string Redact::hexStringToKey(const std::string & hex)
{
    if (hex.size() % 2 != 0)
        throw Exception("odd length hex string: " + hex, LogicalError);
    std::string key(hex.size() / 2, '\0');
    for (size_t i = 0; i < key.size(); ++i)
    {
        int hi = hexValue(hex[i * 2]);
        int lo = hexValue(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0)
            throw Exception("invalid hex string: " + hex, LogicalError);
        key[i] = static_cast<char>((hi << 4) | lo);
    }
    return key;
}

std::string Redact::keyToDebugString(const char * key, const size_t size)
{
    const auto v = Redact::REDACT_LOG.load(std::memory_order_relaxed);
    switch (v)
    {
    case RedactMode::Enable:
        return "?";
    case RedactMode::Disable:
        return Redact::keyToHexString(key, size);
    case RedactMode::Marker:
    {
        // Note: the `s` must be hexadecimal string so we don't need to care
        // about escaping here.
        auto s = Redact::keyToHexString(key, size);
        return std::string("‹") + s + "›";
    }
    default:
        throw Exception(std::string("Should not reach here, v=") + std::to_string(static_cast<int64_t>(v)));
    }
}

} // namespace brsplit
