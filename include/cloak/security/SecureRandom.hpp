#ifndef INCLUDE_CLOAK_SECURITY_SECURERANDOM_HPP
#define INCLUDE_CLOAK_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace cloak::security
{

// Fills `out` from the OS CSPRNG. Returns false if the OS source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace cloak::security

#endif // INCLUDE_CLOAK_SECURITY_SECURERANDOM_HPP
