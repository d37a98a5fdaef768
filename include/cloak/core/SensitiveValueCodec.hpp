#ifndef INCLUDE_CLOAK_CORE_SENSITIVEVALUECODEC_HPP
#define INCLUDE_CLOAK_CORE_SENSITIVEVALUECODEC_HPP

#include "cloak/core/SensitiveValue.hpp"
#include "cloak/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace cloak::core
{

// "CLK1" read as a little-endian u32.
constexpr std::uint32_t g_kSensitiveValueMagic{ 0x314B4C43U };
constexpr std::uint32_t g_kSensitiveValueFormatV1{ 1U };
constexpr std::uint32_t g_kSensitiveValueFormatCurrent{ g_kSensitiveValueFormatV1 };

constexpr std::uint32_t g_kFlagAllowInlineAccess{ 1U << 0U };
constexpr std::uint32_t g_kFlagAllowSerialization{ 1U << 1U };
constexpr std::uint32_t g_kKnownFlags{ g_kFlagAllowInlineAccess | g_kFlagAllowSerialization };

// magic u32 | version u32 | flags u32 | content length u64, all little-endian, then the content.
constexpr std::size_t g_kSensitiveValueHeaderBytes{ 4U + 4U + 4U + 8U };

// Persists the fields exposed by prepareForSerialization(); throws MisuseError
// for a value that disallows serialization. The result holds the secret and is
// wiped when released.
[[nodiscard]] cloak::security::SecureBuffer encodeSensitiveValue(const SensitiveValue& value);

// std::nullopt for anything that encodeSensitiveValue() could not have produced.
[[nodiscard]] std::optional<SensitiveValue> decodeSensitiveValue(std::span<const std::byte> bytes);

} // namespace cloak::core

#endif // INCLUDE_CLOAK_CORE_SENSITIVEVALUECODEC_HPP
