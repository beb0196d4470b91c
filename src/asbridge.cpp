#include <asbridge/asbridge.hpp>
#include <cstring>

namespace asbridge
{
const char* library_version() noexcept
{
#ifdef ASBRIDGE_DEBUG
    return ASBRIDGE_VERSION_STRING " DEBUG";
#else
    return ASBRIDGE_VERSION_STRING;
#endif
}

bool has_max_portability(const char* options)
{
    return std::strstr(options, "AS_MAX_PORTABILITY") != nullptr;
}

bool has_exceptions(const char* options)
{
    return std::strstr(options, "AS_NO_EXCEPTIONS") == nullptr;
}
} // namespace asbridge
