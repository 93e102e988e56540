// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <stdexcept>

#include "regex_utils.hpp"

#include "common/gtest_utils.hpp"

using namespace urlscrub;

namespace {

TEST(TestRegexUtils, RegexInitThrow)
{
    auto valid_regex = regex_init("^[0-9]+$");
    ASSERT_NE(valid_regex, nullptr);
    ASSERT_TRUE(valid_regex->ok());

    EXPECT_THROW(regex_init("$][^"), std::runtime_error);
}

TEST(TestRegexUtils, RegexInitOptions)
{
    auto insensitive = regex_init("abc");
    EXPECT_TRUE(regex_find(*insensitive, "xABCx", 0));

    auto sensitive = regex_init("abc", true);
    EXPECT_FALSE(regex_find(*sensitive, "xABCx", 0));

    auto longest = regex_init("a|ab", true, true);
    auto match = regex_find(*longest, "ab", 0);
    ASSERT_TRUE(match);
    EXPECT_STRV(*match, "ab");
}

TEST(TestRegexUtils, RegexFindFromOffset)
{
    auto regex = regex_init(R"(\bword\b)", true);

    std::string_view subject = "word sword word";
    auto match = regex_find(*regex, subject, 1);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->data() - subject.data(), 11);

    EXPECT_FALSE(regex_find(*regex, subject, 12));
    EXPECT_FALSE(regex_find(*regex, subject, subject.size() + 1));
}

} // namespace
