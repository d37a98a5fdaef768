#ifndef INCLUDE_CLOAK_SECURITY_SECURESTRING_HPP
#define INCLUDE_CLOAK_SECURITY_SECURESTRING_HPP

#include "cloak/security/MemoryWiper.hpp"
#include "cloak/security/ZeroAllocator.hpp"
#include <algorithm>
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace cloak::security
{
using SecureString = std::vector<char, ZeroAllocator<char>>;

// Returns a freshly allocated copy that shares no storage with `input`.
// The bytes are appended in halves through sub-range views; the result is the
// same for any chunking, only the allocation guarantee matters.
[[nodiscard]] inline SecureString copyBytes(std::span<const char> input)
{
    SecureString out{};
    if (input.empty())
    {
        return out;
    }

    out.reserve(input.size());
    const std::size_t chunk{ std::max<std::size_t>(input.size() / 2U, 1U) };
    for (std::size_t offset{}; offset < input.size(); offset += chunk)
    {
        const auto part{ input.subspan(offset, std::min(chunk, input.size() - offset)) };
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    return copyBytes(std::span<const char>{ s.data(), s.size() });
}

[[nodiscard]] inline std::span<const char> asSpan(const SecureString& s) noexcept
{
    return std::span{ s };
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

inline void secureWipeSize(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipeSize(s);
    SecureString empty{};
    s.swap(empty);
}

} // namespace cloak::security

#endif // INCLUDE_CLOAK_SECURITY_SECURESTRING_HPP
