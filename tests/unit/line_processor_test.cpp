// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "line_processor.hpp"

#include "common/gtest_utils.hpp"

#include <memory>
#include <stdexcept>

using namespace std::literals;
using namespace urlscrub;

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

namespace mock {

class redactor : public urlscrub::redactor {
public:
    redactor() : urlscrub::redactor({"api_key"}, "REDACTED") {}
    redactor(const redactor &) = delete;
    redactor(redactor &&) = delete;
    redactor &operator=(const redactor &) = delete;
    redactor &operator=(redactor &&) = delete;
    ~redactor() override = default;

    MOCK_METHOD(redaction_result, redact, (std::string_view url), (const override));
};

} // namespace mock

const std::vector<std::string> default_parameters{
    "api_key", "password", "session_id", "auth_token"};

TEST(TestLineProcessor, RedactEmbeddedURL)
{
    line_processor processor{default_parameters, "REDACTED"};

    auto result = processor.process("Visit https://example.com/path?api_key=SECRET123&x=1 now");
    EXPECT_EQ(result.text, "Visit https://example.com/path?api_key=REDACTED&x=1 now");
    EXPECT_EQ(result.stats.urls_found, 1);
    EXPECT_EQ(result.stats.urls_redacted, 1);
    EXPECT_EQ(result.stats.urls_malformed, 0);
    EXPECT_FALSE(result.failed);
}

TEST(TestLineProcessor, NoURL)
{
    line_processor processor{default_parameters, "REDACTED"};

    for (auto line : {""sv, "No links here."sv, "   \t  "sv, "ftp://example.com/?api_key=1"sv}) {
        auto result = processor.process(line);
        EXPECT_EQ(result.text, line);
        EXPECT_EQ(result.stats.urls_found, 0);
        EXPECT_FALSE(result.failed);
    }
}

TEST(TestLineProcessor, MultipleURLs)
{
    line_processor processor{default_parameters, "REDACTED"};

    auto result = processor.process(
        "GET http://a.com/?password=1 -> https://b.com/x?y=2 -> http://c.com/?session_id=3&z=4");
    EXPECT_EQ(result.text,
        "GET http://a.com/?password=REDACTED -> https://b.com/x?y=2 -> "
        "http://c.com/?session_id=REDACTED&z=4");
    EXPECT_EQ(result.stats.urls_found, 3);
    EXPECT_EQ(result.stats.urls_redacted, 2);
}

TEST(TestLineProcessor, MalformedURLIsPreserved)
{
    line_processor processor{default_parameters, "REDACTED"};

    auto result = processor.process("before https://bad]url?api_key=x after");
    EXPECT_EQ(result.text, "before https://bad]url?api_key=x after");
    EXPECT_EQ(result.stats.urls_found, 1);
    EXPECT_EQ(result.stats.urls_redacted, 0);

    result = processor.process("x http://[::::]/a?api_key=x y http://ok.com/?api_key=z");
    EXPECT_EQ(result.text, "x http://[::::]/a?api_key=x y http://ok.com/?api_key=REDACTED");
    EXPECT_EQ(result.stats.urls_found, 2);
    EXPECT_EQ(result.stats.urls_malformed, 1);
    EXPECT_EQ(result.stats.urls_redacted, 1);
}

TEST(TestLineProcessor, KeepsSurroundingText)
{
    line_processor processor{default_parameters, "REDACTED"};

    auto result = processor.process("\"https://example.com/?auth_token=abc\",\r");
    EXPECT_EQ(result.text, "\"https://example.com/?auth_token=REDACTED\",\r");

    result = processor.process("https://example.com/?auth_token=abc");
    EXPECT_EQ(result.text, "https://example.com/?auth_token=REDACTED");

    // The match stops before non-ASCII characters
    result = processor.process("caf\xC3\xA9 https://example.com/?x=\xC3\xA9t\xC3\xA9");
    EXPECT_EQ(result.text, "caf\xC3\xA9 https://example.com/?x=\xC3\xA9t\xC3\xA9");
    EXPECT_EQ(result.stats.urls_found, 1);
    EXPECT_EQ(result.stats.urls_redacted, 0);
}

TEST(TestLineProcessor, CanonicalMode)
{
    line_processor processor{{"token"}, "REDACTED", query_mode::canonical};

    auto result = processor.process("a https://example.com/?x=1&token=a&x=2&empty=&y=3 b");
    EXPECT_EQ(result.text, "a https://example.com/?x=1&x=2&token=REDACTED&y=3 b");
    EXPECT_EQ(processor.get_redactor().mode(), query_mode::canonical);
}

TEST(TestLineProcessor, Idempotent)
{
    line_processor processor{default_parameters, "REDACTED"};

    std::string_view line =
        "x https://example.com/a?password=p1&password=p2 y http://[::1]:8080/s?session_id=abc";
    auto once = processor.process(line);
    auto twice = processor.process(once.text);
    EXPECT_EQ(once.text, twice.text);
}

TEST(TestLineProcessor, IdempotentWithDotsInToken)
{
    line_processor processor{{"api_key"}, "a.b~c"};

    auto once = processor.process("see https://h/?api_key=s&x=1 now");
    EXPECT_EQ(once.text, "see https://h/?api_key=a%2Eb%7Ec&x=1 now");

    auto twice = processor.process(once.text);
    EXPECT_EQ(twice.text, once.text);
    EXPECT_EQ(twice.stats.urls_found, 1);
}

TEST(TestLineProcessor, TrailingEqualsIsOutsideCandidate)
{
    line_processor processor{default_parameters, "REDACTED"};

    // The candidate ends at the last word character, the dangling '=' is
    // copied after the parameter redacted as having no value
    auto result = processor.process("https://h/p?api_key=");
    EXPECT_EQ(result.text, "https://h/p?api_key=REDACTED=");
    EXPECT_EQ(result.stats.urls_found, 1);
    EXPECT_EQ(result.stats.urls_redacted, 1);
}

TEST(TestLineProcessor, ExceptionLeavesLineUnchanged)
{
    auto instance = std::make_unique<mock::redactor>();
    EXPECT_CALL(*instance, redact(_))
        .WillOnce(Return(redaction_result{
            "https://example.com/?api_key=REDACTED", redaction_status::redacted}))
        .WillOnce(Throw(std::runtime_error("redaction failure")));

    line_processor processor{std::move(instance)};

    std::string_view line = "a https://example.com/?api_key=1 b https://example.com/?api_key=2 c";
    auto result = processor.process(line);
    EXPECT_EQ(result.text, line);
    EXPECT_TRUE(result.failed);
    EXPECT_EQ(result.stats.urls_found, 0);
    EXPECT_EQ(result.stats.urls_redacted, 0);
    EXPECT_EQ(result.stats.urls_malformed, 0);
}

TEST(TestLineProcessor, RequiresRedactor)
{
    EXPECT_THROW(line_processor{std::unique_ptr<redactor>{}}, std::invalid_argument);
}

TEST(TestLineProcessor, StatsAccumulate)
{
    line_stats total;
    total += line_stats{3, 2, 1};
    total += line_stats{1, 0, 1};
    EXPECT_EQ(total.urls_found, 4);
    EXPECT_EQ(total.urls_redacted, 2);
    EXPECT_EQ(total.urls_malformed, 2);
}

} // namespace
