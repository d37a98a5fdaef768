#ifndef CLOAK_SRC_CORE_LITTLEENDIAN_HPP
#define CLOAK_SRC_CORE_LITTLEENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace cloak::core::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };
constexpr std::size_t g_kU64Bytes{ sizeof(std::uint64_t) };

constexpr std::uint64_t g_kByteMaskU64{ 0xFFU };
constexpr std::uint64_t g_kBitsPerByte{ 8U };

template <typename UInt, std::size_t N> inline void writeLE(std::span<std::byte, N> out, UInt v) noexcept
{
    static_assert(N == sizeof(UInt));
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const std::uint64_t shiftBits{ static_cast<std::uint64_t>(i) * g_kBitsPerByte };
        out[i] = static_cast<std::byte>((static_cast<std::uint64_t>(v) >> shiftBits) & g_kByteMaskU64);
    }
}

template <typename UInt, std::size_t N> [[nodiscard]] inline UInt readLE(std::span<const std::byte, N> in) noexcept
{
    static_assert(N == sizeof(UInt));
    std::uint64_t v{ 0U };
    for (std::size_t i{}; i < in.size(); ++i)
    {
        const std::uint64_t shiftBits{ static_cast<std::uint64_t>(i) * g_kBitsPerByte };
        v |= (static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(in[i])) << shiftBits);
    }
    return static_cast<UInt>(v);
}

inline void writeU32LE(std::span<std::byte, g_kU32Bytes> out, std::uint32_t v) noexcept
{
    writeLE<std::uint32_t>(out, v);
}

inline void writeU64LE(std::span<std::byte, g_kU64Bytes> out, std::uint64_t v) noexcept
{
    writeLE<std::uint64_t>(out, v);
}

[[nodiscard]] inline std::uint32_t readU32LE(std::span<const std::byte, g_kU32Bytes> in) noexcept
{
    return readLE<std::uint32_t>(in);
}

[[nodiscard]] inline std::uint64_t readU64LE(std::span<const std::byte, g_kU64Bytes> in) noexcept
{
    return readLE<std::uint64_t>(in);
}

} // namespace cloak::core::detail

#endif // CLOAK_SRC_CORE_LITTLEENDIAN_HPP
