#include "cloak/core/SensitiveValueCodec.hpp"

#include "LittleEndian.hpp"
#include "cloak/security/SecureString.hpp"
#include <cstddef>

namespace cloak::core
{
namespace
{

constexpr std::size_t g_kU32Bytes{ cloak::core::detail::g_kU32Bytes };
constexpr std::size_t g_kU64Bytes{ cloak::core::detail::g_kU64Bytes };

[[nodiscard]] std::uint32_t flagsFrom(const SerializableFields& fields) noexcept
{
    std::uint32_t flags{ 0U };
    if (fields.allowInlineAccess)
    {
        flags |= g_kFlagAllowInlineAccess;
    }
    if (fields.allowSerialization)
    {
        flags |= g_kFlagAllowSerialization;
    }
    return flags;
}

} // namespace

cloak::security::SecureBuffer encodeSensitiveValue(const SensitiveValue& value)
{
    const SerializableFields fields{ value.prepareForSerialization() };

    cloak::security::SecureBuffer out(g_kSensitiveValueHeaderBytes + fields.content.size());
    const auto bytes{ cloak::security::asWritableBytes(out) };

    std::size_t offset{};
    cloak::core::detail::writeU32LE(std::span<std::byte, g_kU32Bytes>{ bytes.data() + offset, g_kU32Bytes },
                                    g_kSensitiveValueMagic);
    offset += g_kU32Bytes;

    cloak::core::detail::writeU32LE(std::span<std::byte, g_kU32Bytes>{ bytes.data() + offset, g_kU32Bytes },
                                    g_kSensitiveValueFormatCurrent);
    offset += g_kU32Bytes;

    cloak::core::detail::writeU32LE(std::span<std::byte, g_kU32Bytes>{ bytes.data() + offset, g_kU32Bytes },
                                    flagsFrom(fields));
    offset += g_kU32Bytes;

    cloak::core::detail::writeU64LE(std::span<std::byte, g_kU64Bytes>{ bytes.data() + offset, g_kU64Bytes },
                                    static_cast<std::uint64_t>(fields.content.size()));
    offset += g_kU64Bytes;

    for (std::size_t i{}; i < fields.content.size(); ++i)
    {
        out[offset + i] = static_cast<std::uint8_t>(static_cast<unsigned char>(fields.content[i]));
    }

    return out;
}

std::optional<SensitiveValue> decodeSensitiveValue(std::span<const std::byte> bytes)
{
    if (bytes.size() < g_kSensitiveValueHeaderBytes)
    {
        return std::nullopt;
    }

    std::size_t offset{};
    const std::uint32_t magic{ cloak::core::detail::readU32LE(
        std::span<const std::byte, g_kU32Bytes>{ bytes.data() + offset, g_kU32Bytes }) };
    offset += g_kU32Bytes;

    const std::uint32_t version{ cloak::core::detail::readU32LE(
        std::span<const std::byte, g_kU32Bytes>{ bytes.data() + offset, g_kU32Bytes }) };
    offset += g_kU32Bytes;

    const std::uint32_t flags{ cloak::core::detail::readU32LE(
        std::span<const std::byte, g_kU32Bytes>{ bytes.data() + offset, g_kU32Bytes }) };
    offset += g_kU32Bytes;

    const std::uint64_t length{ cloak::core::detail::readU64LE(
        std::span<const std::byte, g_kU64Bytes>{ bytes.data() + offset, g_kU64Bytes }) };
    offset += g_kU64Bytes;

    if (magic != g_kSensitiveValueMagic || version != g_kSensitiveValueFormatV1)
    {
        return std::nullopt;
    }
    if ((flags & ~g_kKnownFlags) != 0U || (flags & g_kFlagAllowSerialization) == 0U)
    {
        return std::nullopt;
    }

    const std::size_t remaining{ bytes.size() - offset };
    if (length != static_cast<std::uint64_t>(remaining))
    {
        return std::nullopt;
    }

    cloak::security::SecureString content{};
    content.reserve(remaining);
    for (const std::byte b : bytes.subspan(offset))
    {
        content.push_back(static_cast<char>(std::to_integer<unsigned char>(b)));
    }

    return SensitiveValue{ cloak::security::asStringView(content), (flags & g_kFlagAllowInlineAccess) != 0U,
                           (flags & g_kFlagAllowSerialization) != 0U };
}

} // namespace cloak::core
