#include "cloak/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <string.h>
#endif

namespace cloak::security
{
namespace detail
{

void xorWipe(std::span<std::byte> bytes) noexcept
{
    volatile std::byte* p{ bytes.data() };
    for (std::size_t i{}; i < bytes.size(); ++i)
    {
        const std::byte current{ p[i] };
        p[i] = current ^ current;
    }
}

} // namespace detail

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(bytes.data(), bytes.size());
#elif defined(__linux__)
    ::explicit_bzero(bytes.data(), bytes.size());
#else
    detail::xorWipe(bytes);
#endif
}
} // namespace cloak::security
