// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "query_string.hpp"

#include "common/gtest_utils.hpp"

using namespace std::literals;
using namespace urlscrub;

namespace {

TEST(TestQueryString, SplitSimple)
{
    auto params = query_split("api_key=SECRET123&x=1");
    ASSERT_EQ(params.size(), 2);

    EXPECT_STRV(params[0].raw, "api_key=SECRET123");
    EXPECT_STRV(params[0].raw_name, "api_key");
    EXPECT_STRV(params[0].raw_value, "SECRET123");
    EXPECT_TRUE(params[0].has_value);
    EXPECT_EQ(params[0].name, "api_key");

    EXPECT_STRV(params[1].raw_name, "x");
    EXPECT_STRV(params[1].raw_value, "1");
}

TEST(TestQueryString, SplitKeepsEmptyElements)
{
    auto params = query_split("a=1&&b&c=&=d&");
    ASSERT_EQ(params.size(), 6);

    EXPECT_STRV(params[0].raw, "a=1");

    EXPECT_TRUE(params[1].raw.empty());
    EXPECT_FALSE(params[1].has_value);

    EXPECT_STRV(params[2].raw_name, "b");
    EXPECT_FALSE(params[2].has_value);

    EXPECT_STRV(params[3].raw_name, "c");
    EXPECT_TRUE(params[3].has_value);
    EXPECT_TRUE(params[3].raw_value.empty());

    EXPECT_TRUE(params[4].raw_name.empty());
    EXPECT_STRV(params[4].raw_value, "d");

    EXPECT_TRUE(params[5].raw.empty());
}

TEST(TestQueryString, SplitValueWithEquals)
{
    auto params = query_split("token=a=b=c");
    ASSERT_EQ(params.size(), 1);
    EXPECT_STRV(params[0].raw_name, "token");
    EXPECT_STRV(params[0].raw_value, "a=b=c");
}

TEST(TestQueryString, SplitDecodesNames)
{
    auto params = query_split("api%5Fkey=1&auth+token=2&pass%77ord=3");
    ASSERT_EQ(params.size(), 3);
    EXPECT_EQ(params[0].name, "api_key");
    EXPECT_STRV(params[0].raw_name, "api%5Fkey");
    EXPECT_EQ(params[1].name, "auth token");
    EXPECT_EQ(params[2].name, "password");
}

TEST(TestQueryString, FormDecode)
{
    EXPECT_EQ(form_decode(""), "");
    EXPECT_EQ(form_decode("plain"), "plain");
    EXPECT_EQ(form_decode("a+b"), "a b");
    EXPECT_EQ(form_decode("%41%42%43"), "ABC");
    EXPECT_EQ(form_decode("%e2%82%ac"), "\xE2\x82\xAC");
    EXPECT_EQ(form_decode("%2B"), "+");
    // Invalid or truncated escapes are kept
    EXPECT_EQ(form_decode("%"), "%");
    EXPECT_EQ(form_decode("%4"), "%4");
    EXPECT_EQ(form_decode("%zz"), "%zz");
    EXPECT_EQ(form_decode("100%"), "100%");
}

TEST(TestQueryString, FormEncode)
{
    EXPECT_EQ(form_encode(""), "");
    EXPECT_EQ(form_encode("REDACTED"), "REDACTED");
    EXPECT_EQ(form_encode("a_b.c-d~e"), "a_b.c-d~e");
    EXPECT_EQ(form_encode("a b"), "a+b");
    EXPECT_EQ(form_encode("<redacted>"), "%3Credacted%3E");
    EXPECT_EQ(form_encode("a&b=c"), "a%26b%3Dc");
    EXPECT_EQ(form_encode("\xE2\x82\xAC"), "%E2%82%AC");
    EXPECT_EQ(form_encode("+%"), "%2B%25");
}

TEST(TestQueryString, FormEncodeDecodedText)
{
    for (auto text : {"hello world"sv, "a+b&c"sv, "50%"sv, "caf\xC3\xA9"sv, "[x]"sv}) {
        EXPECT_EQ(form_decode(form_encode(text)), text);
    }
}

} // namespace
