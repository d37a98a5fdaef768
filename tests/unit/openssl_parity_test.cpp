#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include <openssl/crypto.h>

#include "cloak/security/MemoryWiper.hpp"
#include "cloak/security/SecureEquals.hpp"
#include "cloak/security/SecureRandom.hpp"

namespace
{

constexpr std::size_t g_kBlockBytes{ 64U };
constexpr int g_kRounds{ 32 };

using Block = std::array<std::uint8_t, g_kBlockBytes>;

[[nodiscard]] bool nativeEquals(const Block& a, const Block& b) noexcept
{
    return cloak::security::secureEquals(std::as_bytes(std::span{ a }), std::as_bytes(std::span{ b }));
}

[[nodiscard]] bool opensslEquals(const Block& a, const Block& b) noexcept
{
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace

TEST(OpenSslParity, SecureEqualsAgreesWithCryptoMemcmp)
{
    for (int round{}; round < g_kRounds; ++round)
    {
        Block a{};
        ASSERT_TRUE(cloak::security::secureRandomFill(std::span{ a }));

        Block same{ a };
        EXPECT_EQ(nativeEquals(a, same), opensslEquals(a, same));
        EXPECT_TRUE(nativeEquals(a, same));

        Block flipped{ a };
        const std::size_t index{ static_cast<std::size_t>(round) % g_kBlockBytes };
        flipped[index] = static_cast<std::uint8_t>(flipped[index] ^ 0x01U);
        EXPECT_EQ(nativeEquals(a, flipped), opensslEquals(a, flipped));
        EXPECT_FALSE(nativeEquals(a, flipped));
    }
}

TEST(OpenSslParity, SecureWipeMatchesOpenSslCleanse)
{
    Block native{};
    ASSERT_TRUE(cloak::security::secureRandomFill(std::span{ native }));
    Block openssl{ native };

    cloak::security::secureWipe(std::span<std::uint8_t>{ native });
    OPENSSL_cleanse(openssl.data(), openssl.size());

    EXPECT_EQ(native, openssl);
    EXPECT_EQ(native, Block{});
}
