#ifndef INCLUDE_CLOAK_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_CLOAK_SECURITY_SECUREEQUALS_HPP

#include "cloak/security/SecureBuffer.hpp"
#include "cloak/security/SecureString.hpp"
#include <cstddef>
#include <span>

namespace cloak::security
{
// Equality for secrets, used by SensitiveValue::equals.
//
// For inputs of equal length, every byte pair is visited and differences are
// OR-ed into a volatile accumulator, so running time does not depend on where
// (or whether) the contents differ. Lengths are compared first and a mismatch
// returns early; a holder's length is not treated as secret (see
// SensitiveValue::size()).
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};

    for (std::size_t i{}; i < a.size(); ++i)
    {
        const unsigned char x{ std::to_integer<unsigned char>(a[i]) };
        const unsigned char y{ std::to_integer<unsigned char>(b[i]) };

        diff = static_cast<unsigned char>(diff | (x ^ y));
    }

    return (diff == 0);
}

// Holder content and getValue() copies.
[[nodiscard]] inline bool secureEquals(const SecureString& a, const SecureString& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

// Encoded SensitiveValue records.
[[nodiscard]] inline bool secureEquals(const SecureBuffer& a, const SecureBuffer& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace cloak::security

#endif // INCLUDE_CLOAK_SECURITY_SECUREEQUALS_HPP
