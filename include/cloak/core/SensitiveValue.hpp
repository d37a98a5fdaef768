#ifndef INCLUDE_CLOAK_CORE_SENSITIVEVALUE_HPP
#define INCLUDE_CLOAK_CORE_SENSITIVEVALUE_HPP

#include "cloak/security/SecureString.hpp"
#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>

namespace cloak::core
{

struct SensitivePolicy final
{
    bool allowInlineAccess{ false };
    bool allowSerialization{ false };
};

constexpr SensitivePolicy g_kLockedPolicy{ .allowInlineAccess = false, .allowSerialization = false };
constexpr SensitivePolicy g_kInlineablePolicy{ .allowInlineAccess = true, .allowSerialization = false };
constexpr SensitivePolicy g_kSerializablePolicy{ .allowInlineAccess = false, .allowSerialization = true };
constexpr SensitivePolicy g_kOpenPolicy{ .allowInlineAccess = true, .allowSerialization = true };

constexpr std::string_view g_kDebugContentKey{ "content" };
constexpr std::string_view g_kDebugNoticeKey{ "notice" };
constexpr std::string_view g_kDebugRedacted{ "*" };
constexpr std::string_view g_kDebugNotice{ "use getValue() to access the content" };

// Everything a serializer may persist for one SensitiveValue.
struct SerializableFields final
{
    cloak::security::SecureString content;
    bool allowInlineAccess{ false };
    bool allowSerialization{ false };
};

// Holds a secret (password, plaintext) and keeps it out of logs, formatted
// output and serialized state unless its policy says otherwise.
//
// - getValue() always works and returns an independent copy.
// - The string cast and prepareForSerialization() throw MisuseError when
//   the matching flag is off.
// - Stream and fmt output are always redacted, whatever the flags.
// - The content is zeroed before its storage is released.
//
// Move-only: duplicating a secret has to be spelled out through getValue().
class SensitiveValue final
{
public:
    SensitiveValue(std::string_view value, bool allowInlineAccess, bool allowSerialization);
    SensitiveValue(std::string_view value, SensitivePolicy policy);

    [[nodiscard]] static SensitiveValue createLocked(std::string_view value);
    [[nodiscard]] static SensitiveValue createInlineable(std::string_view value);
    [[nodiscard]] static SensitiveValue createSerializable(std::string_view value);
    [[nodiscard]] static SensitiveValue createOpen(std::string_view value);

    SensitiveValue(const SensitiveValue&) = delete;
    SensitiveValue& operator=(const SensitiveValue&) = delete;
    SensitiveValue(SensitiveValue&& other) noexcept;
    SensitiveValue& operator=(SensitiveValue&& other) noexcept;
    ~SensitiveValue() noexcept;

    [[nodiscard]] cloak::security::SecureString getValue() const;

    [[nodiscard]] bool equals(const SensitiveValue& other) const noexcept;

    // Throws MisuseError unless inline access is allowed.
    [[nodiscard]] std::string toDisplayString() const;
    explicit operator std::string() const;

    // Throws MisuseError unless serialization is allowed.
    [[nodiscard]] SerializableFields prepareForSerialization() const;

    [[nodiscard]] std::map<std::string, std::string> debugRepresentation() const;

    [[nodiscard]] SensitivePolicy policy() const noexcept;
    [[nodiscard]] bool allowsInlineAccess() const noexcept;
    [[nodiscard]] bool allowsSerialization() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

private:
    cloak::security::SecureString m_content;
    SensitivePolicy m_policy{};
};

[[nodiscard]] bool operator==(const SensitiveValue& lhs, const SensitiveValue& rhs) noexcept;

// Single-line rendering of debugRepresentation(); never contains the content.
[[nodiscard]] std::string toDebugString(const SensitiveValue& value);

std::ostream& operator<<(std::ostream& os, const SensitiveValue& value);

} // namespace cloak::core

#endif // INCLUDE_CLOAK_CORE_SENSITIVEVALUE_HPP
