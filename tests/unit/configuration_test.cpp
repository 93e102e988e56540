// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "configuration.hpp"
#include "exception.hpp"

#include "common/gtest_utils.hpp"

using namespace std::literals;
using namespace urlscrub;

namespace {

TEST(TestConfiguration, Defaults)
{
    configuration config;
    EXPECT_THAT(config.parameters,
        ::testing::ElementsAre("api_key", "password", "session_id", "auth_token"));
    EXPECT_EQ(config.redaction_string, "REDACTED");
    EXPECT_EQ(config.level, log_level::info);
    EXPECT_EQ(config.mode, query_mode::preserve);
    EXPECT_EQ(config.encoding, text_encoding::automatic);
    EXPECT_NO_THROW(validate_configuration(config));
}

TEST(TestConfiguration, ParseParameterList)
{
    EXPECT_THAT(parse_parameter_list("api_key,token"), ::testing::ElementsAre("api_key", "token"));
    EXPECT_THAT(parse_parameter_list(" api_key , token ,, "),
        ::testing::ElementsAre("api_key", "token"));
    EXPECT_TRUE(parse_parameter_list("").empty());
    EXPECT_TRUE(parse_parameter_list(" , ,").empty());
}

TEST(TestConfiguration, ParseLogLevel)
{
    EXPECT_EQ(parse_log_level("trace"), log_level::trace);
    EXPECT_EQ(parse_log_level("DEBUG"), log_level::debug);
    EXPECT_EQ(parse_log_level("Info"), log_level::info);
    EXPECT_EQ(parse_log_level("warn"), log_level::warn);
    EXPECT_EQ(parse_log_level("WARNING"), log_level::warn);
    EXPECT_EQ(parse_log_level("error"), log_level::error);
    EXPECT_EQ(parse_log_level("CRITICAL"), log_level::error);
    EXPECT_EQ(parse_log_level("off"), log_level::off);

    EXPECT_THROW(parse_log_level(""), configuration_error);
    EXPECT_THROW(parse_log_level("verbose"), configuration_error);
}

TEST(TestConfiguration, ParseQueryMode)
{
    EXPECT_EQ(parse_query_mode("preserve"), query_mode::preserve);
    EXPECT_EQ(parse_query_mode("CANONICAL"), query_mode::canonical);
    EXPECT_THROW(parse_query_mode("sorted"), configuration_error);
}

TEST(TestConfiguration, ParseEncoding)
{
    EXPECT_EQ(parse_encoding("auto"), text_encoding::automatic);
    EXPECT_EQ(parse_encoding("UTF-8"), text_encoding::utf8);
    EXPECT_EQ(parse_encoding("utf-16le"), text_encoding::utf16le);
    EXPECT_EQ(parse_encoding("utf16be"), text_encoding::utf16be);
    EXPECT_EQ(parse_encoding("latin-1"), text_encoding::latin1);
    EXPECT_EQ(parse_encoding("iso-8859-1"), text_encoding::latin1);
    EXPECT_THROW(parse_encoding("ebcdic"), configuration_error);
}

TEST(TestConfiguration, LoadAllKeys)
{
    auto node = YAML::Load(R"(
parameters: [token, secret]
redaction_string: "<redacted>"
log_level: debug
query_mode: canonical
encoding: latin-1
)");

    configuration config;
    load_configuration(node, config);

    EXPECT_THAT(config.parameters, ::testing::ElementsAre("token", "secret"));
    EXPECT_EQ(config.redaction_string, "<redacted>");
    EXPECT_EQ(config.level, log_level::debug);
    EXPECT_EQ(config.mode, query_mode::canonical);
    EXPECT_EQ(config.encoding, text_encoding::latin1);
}

TEST(TestConfiguration, LoadPartial)
{
    configuration config;
    load_configuration(YAML::Load("parameters: 'a, b'\nunknown: 1"), config);

    EXPECT_THAT(config.parameters, ::testing::ElementsAre("a", "b"));
    EXPECT_EQ(config.redaction_string, "REDACTED");
    EXPECT_EQ(config.mode, query_mode::preserve);
}

TEST(TestConfiguration, LoadEmptyDocument)
{
    configuration config;
    EXPECT_NO_THROW(load_configuration(YAML::Load(""), config));
    EXPECT_EQ(config.parameters.size(), 4);
}

TEST(TestConfiguration, LoadInvalid)
{
    configuration config;
    EXPECT_THROW(load_configuration(YAML::Load("[a, b]"), config), configuration_error);
    EXPECT_THROW(load_configuration(YAML::Load("parameters: {a: b}"), config), configuration_error);
    EXPECT_THROW(load_configuration(YAML::Load("parameters: [[a]]"), config), configuration_error);
    EXPECT_THROW(load_configuration(YAML::Load("redaction_string: [x]"), config),
        configuration_error);
    EXPECT_THROW(load_configuration(YAML::Load("log_level: loud"), config), configuration_error);
    EXPECT_THROW(load_configuration(YAML::Load("query_mode: x"), config), configuration_error);
    EXPECT_THROW(load_configuration(YAML::Load("encoding: x"), config), configuration_error);
}

TEST(TestConfiguration, LoadFile)
{
    configuration config;
    load_configuration_file("unit/yaml/configuration.yaml", config);

    EXPECT_THAT(config.parameters, ::testing::ElementsAre("api_key", "access_token"));
    EXPECT_EQ(config.redaction_string, "XXX");
    EXPECT_EQ(config.level, log_level::warn);

    EXPECT_THROW(load_configuration_file("unit/yaml/does_not_exist.yaml", config),
        configuration_error);
}

TEST(TestConfiguration, Validate)
{
    configuration config;
    config.redaction_string.clear();
    EXPECT_THROW(validate_configuration(config), configuration_error);

    config.redaction_string = "x";
    config.parameters.clear();
    EXPECT_NO_THROW(validate_configuration(config));
}

} // namespace
