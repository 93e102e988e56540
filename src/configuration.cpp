// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "configuration.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "utils.hpp"

using namespace std::literals;

namespace urlscrub {

namespace {

std::string as_string(const YAML::Node &node, std::string_view key)
{
    if (!node.IsScalar()) {
        throw configuration_error("invalid type for '" + std::string{key} + "', expected string");
    }
    return node.Scalar();
}

std::vector<std::string> as_parameter_list(const YAML::Node &node)
{
    if (node.IsScalar()) {
        return parse_parameter_list(node.Scalar());
    }

    if (!node.IsSequence()) {
        throw configuration_error("invalid type for 'parameters', expected sequence or string");
    }

    std::vector<std::string> parameters;
    for (const auto &item : node) {
        auto name = as_string(item, "parameters");
        auto trimmed = trim(name);
        if (!trimmed.empty()) {
            parameters.emplace_back(trimmed);
        }
    }
    return parameters;
}

} // namespace

std::vector<std::string> parse_parameter_list(std::string_view list)
{
    std::vector<std::string> parameters;
    for (auto name : split(list, ',')) {
        name = trim(name);
        if (!name.empty()) {
            parameters.emplace_back(name);
        }
    }
    return parameters;
}

log_level parse_log_level(std::string_view str)
{
    if (string_iequals(str, "trace"sv)) {
        return log_level::trace;
    }

    if (string_iequals(str, "debug"sv)) {
        return log_level::debug;
    }

    if (string_iequals(str, "info"sv)) {
        return log_level::info;
    }

    if (string_iequals(str, "warn"sv) || string_iequals(str, "warning"sv)) {
        return log_level::warn;
    }

    if (string_iequals(str, "error"sv) || string_iequals(str, "critical"sv)) {
        return log_level::error;
    }

    if (string_iequals(str, "off"sv)) {
        return log_level::off;
    }

    throw configuration_error("invalid log level: " + std::string{str});
}

query_mode parse_query_mode(std::string_view str)
{
    if (string_iequals(str, "preserve"sv)) {
        return query_mode::preserve;
    }

    if (string_iequals(str, "canonical"sv)) {
        return query_mode::canonical;
    }

    throw configuration_error("invalid query mode: " + std::string{str});
}

text_encoding parse_encoding(std::string_view str)
{
    auto encoding = encoding_from_string(str);
    if (!encoding.has_value()) {
        throw configuration_error("unsupported encoding: " + std::string{str});
    }
    return *encoding;
}

void load_configuration(const YAML::Node &node, configuration &config)
{
    if (node.IsNull()) {
        // Empty document
        return;
    }

    if (!node.IsMap()) {
        throw configuration_error("invalid configuration, expected a map");
    }

    try {
        for (const auto &entry : node) {
            auto key = entry.first.as<std::string>();
            const auto &value = entry.second;

            if (key == "parameters") {
                config.parameters = as_parameter_list(value);
            } else if (key == "redaction_string") {
                config.redaction_string = as_string(value, key);
            } else if (key == "log_level") {
                config.level = parse_log_level(as_string(value, key));
            } else if (key == "query_mode") {
                config.mode = parse_query_mode(as_string(value, key));
            } else if (key == "encoding") {
                config.encoding = parse_encoding(as_string(value, key));
            } else {
                URLSCRUB_WARN("Ignoring unknown configuration key: {}", key);
            }
        }
    } catch (const YAML::Exception &e) {
        throw configuration_error(std::string{"invalid configuration: "} + e.what());
    }
}

void load_configuration_file(std::string_view path, configuration &config)
{
    URLSCRUB_DEBUG("Loading configuration from {}", path);

    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string{path});
    } catch (const YAML::Exception &e) {
        throw configuration_error(
            "failed to load configuration " + std::string{path} + ": " + e.what());
    }

    load_configuration(root, config);
}

void validate_configuration(const configuration &config)
{
    if (config.redaction_string.empty()) {
        throw configuration_error("the redaction string can't be empty");
    }

    if (config.parameters.empty()) {
        URLSCRUB_WARN("No parameters to redact, URLs will be left untouched");
    }
}

} // namespace urlscrub
