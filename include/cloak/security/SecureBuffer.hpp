#ifndef INCLUDE_CLOAK_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_CLOAK_SECURITY_SECUREBUFFER_HPP

#include "cloak/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace cloak::security
{
// Raw bytes that may carry secrets, e.g. an encoded SensitiveValue.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

inline void secureWipeSize(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
}

inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipeSize(b);
    SecureBuffer empty{};
    b.swap(empty);
}

} // namespace cloak::security

#endif // INCLUDE_CLOAK_SECURITY_SECUREBUFFER_HPP
