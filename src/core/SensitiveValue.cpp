#include "cloak/core/SensitiveValue.hpp"

#include "cloak/core/Errors.hpp"
#include "cloak/security/SecureEquals.hpp"
#include <ostream>
#include <span>
#include <utility>

namespace cloak::core
{

SensitiveValue::SensitiveValue(std::string_view value, bool allowInlineAccess, bool allowSerialization)
    : m_content{ cloak::security::copyBytes(std::span<const char>{ value.data(), value.size() }) },
      m_policy{ .allowInlineAccess = allowInlineAccess, .allowSerialization = allowSerialization }
{
}

SensitiveValue::SensitiveValue(std::string_view value, SensitivePolicy policy)
    : SensitiveValue(value, policy.allowInlineAccess, policy.allowSerialization)
{
}

SensitiveValue SensitiveValue::createLocked(std::string_view value)
{
    return SensitiveValue{ value, g_kLockedPolicy };
}

SensitiveValue SensitiveValue::createInlineable(std::string_view value)
{
    return SensitiveValue{ value, g_kInlineablePolicy };
}

SensitiveValue SensitiveValue::createSerializable(std::string_view value)
{
    return SensitiveValue{ value, g_kSerializablePolicy };
}

SensitiveValue SensitiveValue::createOpen(std::string_view value)
{
    return SensitiveValue{ value, g_kOpenPolicy };
}

SensitiveValue::SensitiveValue(SensitiveValue&& other) noexcept : m_content{}, m_policy{ other.m_policy }
{
    m_content.swap(other.m_content);
}

SensitiveValue& SensitiveValue::operator=(SensitiveValue&& other) noexcept
{
    if (this == &other)
    {
        return *this;
    }

    cloak::security::secureRelease(m_content);
    m_content.swap(other.m_content);
    m_policy = other.m_policy;
    return *this;
}

SensitiveValue::~SensitiveValue() noexcept
{
    cloak::security::secureRelease(m_content);
}

cloak::security::SecureString SensitiveValue::getValue() const
{
    return cloak::security::copyBytes(cloak::security::asSpan(m_content));
}

bool SensitiveValue::equals(const SensitiveValue& other) const noexcept
{
    return cloak::security::secureEquals(m_content, other.m_content);
}

std::string SensitiveValue::toDisplayString() const
{
    if (!m_policy.allowInlineAccess)
    {
        throw MisuseError("SensitiveValue: inline access is disabled, use getValue()");
    }
    return std::string{ cloak::security::asStringView(m_content) };
}

SensitiveValue::operator std::string() const
{
    return toDisplayString();
}

SerializableFields SensitiveValue::prepareForSerialization() const
{
    if (!m_policy.allowSerialization)
    {
        throw MisuseError("SensitiveValue: serialization is disabled");
    }
    return SerializableFields{ .content = getValue(),
                               .allowInlineAccess = m_policy.allowInlineAccess,
                               .allowSerialization = m_policy.allowSerialization };
}

std::map<std::string, std::string> SensitiveValue::debugRepresentation() const
{
    return { { std::string{ g_kDebugContentKey }, std::string{ g_kDebugRedacted } },
             { std::string{ g_kDebugNoticeKey }, std::string{ g_kDebugNotice } } };
}

SensitivePolicy SensitiveValue::policy() const noexcept
{
    return m_policy;
}

bool SensitiveValue::allowsInlineAccess() const noexcept
{
    return m_policy.allowInlineAccess;
}

bool SensitiveValue::allowsSerialization() const noexcept
{
    return m_policy.allowSerialization;
}

std::size_t SensitiveValue::size() const noexcept
{
    return m_content.size();
}

bool SensitiveValue::empty() const noexcept
{
    return m_content.empty();
}

bool operator==(const SensitiveValue& lhs, const SensitiveValue& rhs) noexcept
{
    return lhs.equals(rhs);
}

std::string toDebugString(const SensitiveValue& value)
{
    std::string out{ "SensitiveValue{" };
    bool first{ true };
    for (const auto& [key, text] : value.debugRepresentation())
    {
        if (!first)
        {
            out += ", ";
        }
        first = false;
        out += key;
        out += ": ";
        out += text;
    }
    out += '}';
    return out;
}

std::ostream& operator<<(std::ostream& os, const SensitiveValue& value)
{
    return os << toDebugString(value);
}

} // namespace cloak::core
