#ifndef INCLUDE_CLOAK_CORE_SENSITIVEVALUEFORMAT_HPP
#define INCLUDE_CLOAK_CORE_SENSITIVEVALUEFORMAT_HPP

#include "cloak/core/SensitiveValue.hpp"
#include <fmt/format.h>
#include <string>

// fmt::format("{}", value) prints the redacted debug representation, the same
// text as operator<<. Width/alignment specs apply to that text.
template <> struct fmt::formatter<cloak::core::SensitiveValue> : fmt::formatter<fmt::string_view>
{
    template <typename FormatContext>
    auto format(const cloak::core::SensitiveValue& value, FormatContext& ctx) const -> decltype(ctx.out())
    {
        const std::string text{ cloak::core::toDebugString(value) };
        return fmt::formatter<fmt::string_view>::format(fmt::string_view{ text.data(), text.size() }, ctx);
    }
};

#endif // INCLUDE_CLOAK_CORE_SENSITIVEVALUEFORMAT_HPP
