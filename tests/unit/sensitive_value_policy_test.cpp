#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "cloak/core/Errors.hpp"
#include "cloak/core/SensitiveValue.hpp"
#include "cloak/core/SensitiveValueCodec.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

using cloak::core::MisuseError;
using cloak::core::SensitivePolicy;
using cloak::core::SensitiveValue;
using ::testing::HasSubstr;
using ::testing::Not;

struct PolicyCase
{
    const char* name;
    SensitivePolicy policy;
};

class SensitiveValuePolicyTest : public ::testing::TestWithParam<PolicyCase>
{
};

TEST_P(SensitiveValuePolicyTest, StreamOutputNeverContainsContent)
{
    const std::string secret{ cloak::test_utils::randomSecret() };
    const SensitiveValue value{ secret, GetParam().policy };

    std::ostringstream os;
    os << value;

    EXPECT_THAT(os.str(), Not(HasSubstr(secret)));
    EXPECT_THAT(os.str(), HasSubstr("use getValue() to access the content"));
}

TEST_P(SensitiveValuePolicyTest, DebugRepresentationNeverContainsContent)
{
    const std::string secret{ cloak::test_utils::randomSecret() };
    const SensitiveValue value{ secret, GetParam().policy };

    for (const auto& [key, text] : value.debugRepresentation())
    {
        EXPECT_THAT(text, Not(HasSubstr(secret))) << key;
    }
}

TEST_P(SensitiveValuePolicyTest, TextualCastFollowsInlineFlag)
{
    const std::string secret{ cloak::test_utils::randomSecret() };
    const SensitiveValue value{ secret, GetParam().policy };

    if (GetParam().policy.allowInlineAccess)
    {
        EXPECT_EQ(value.toDisplayString(), secret);
        EXPECT_EQ(static_cast<std::string>(value), secret);
    }
    else
    {
        EXPECT_THROW({ [[maybe_unused]] const auto s = value.toDisplayString(); }, MisuseError);
        EXPECT_THROW({ [[maybe_unused]] const auto s = static_cast<std::string>(value); }, MisuseError);
    }
}

TEST_P(SensitiveValuePolicyTest, SerializationFollowsSerializeFlag)
{
    const std::string secret{ cloak::test_utils::randomSecret() };
    const SensitiveValue value{ secret, GetParam().policy };

    if (GetParam().policy.allowSerialization)
    {
        const auto fields{ value.prepareForSerialization() };
        EXPECT_EQ(cloak::security::asStringView(fields.content), secret);
        EXPECT_EQ(fields.allowInlineAccess, GetParam().policy.allowInlineAccess);
        EXPECT_TRUE(fields.allowSerialization);

        const auto encoded{ cloak::core::encodeSensitiveValue(value) };
        EXPECT_THAT(cloak::test_utils::asText(cloak::security::asSpan(encoded)), HasSubstr(secret));
    }
    else
    {
        EXPECT_THROW({ [[maybe_unused]] const auto f = value.prepareForSerialization(); }, MisuseError);
        EXPECT_THROW({ [[maybe_unused]] const auto e = cloak::core::encodeSensitiveValue(value); }, MisuseError);
    }
}

TEST_P(SensitiveValuePolicyTest, RefusedCastMessageDoesNotLeakContent)
{
    if (GetParam().policy.allowInlineAccess)
    {
        GTEST_SKIP() << "inline access is allowed for this policy";
    }

    const std::string secret{ cloak::test_utils::randomSecret() };
    const SensitiveValue value{ secret, GetParam().policy };

    try
    {
        [[maybe_unused]] const auto s = value.toDisplayString();
        ADD_FAILURE() << "toDisplayString() did not throw MisuseError";
    }
    catch (const MisuseError& e)
    {
        EXPECT_THAT(std::string{ e.what() }, Not(HasSubstr(secret)));
        EXPECT_THAT(std::string{ e.what() }, HasSubstr("inline access"));
    }
}

TEST_P(SensitiveValuePolicyTest, RefusedSerializationMessageDoesNotLeakContent)
{
    if (GetParam().policy.allowSerialization)
    {
        GTEST_SKIP() << "serialization is allowed for this policy";
    }

    const std::string secret{ cloak::test_utils::randomSecret() };
    const SensitiveValue value{ secret, GetParam().policy };

    try
    {
        [[maybe_unused]] const auto f = value.prepareForSerialization();
        ADD_FAILURE() << "prepareForSerialization() did not throw MisuseError";
    }
    catch (const MisuseError& e)
    {
        EXPECT_THAT(std::string{ e.what() }, Not(HasSubstr(secret)));
        EXPECT_THAT(std::string{ e.what() }, HasSubstr("serialization"));
    }
}

INSTANTIATE_TEST_SUITE_P(AllPolicies, SensitiveValuePolicyTest,
                         ::testing::Values(PolicyCase{ "Locked", cloak::core::g_kLockedPolicy },
                                           PolicyCase{ "Inlineable", cloak::core::g_kInlineablePolicy },
                                           PolicyCase{ "Serializable", cloak::core::g_kSerializablePolicy },
                                           PolicyCase{ "Open", cloak::core::g_kOpenPolicy }),
                         [](const ::testing::TestParamInfo<PolicyCase>& info) { return std::string{ info.param.name }; });

} // namespace
