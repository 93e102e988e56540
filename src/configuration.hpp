// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "log.hpp"
#include "redactor.hpp"
#include "text_decoder.hpp"

namespace urlscrub {

struct configuration {
    std::vector<std::string> parameters{"api_key", "password", "session_id", "auth_token"};
    std::string redaction_string{redactor::default_redaction_string};
    log_level level{log_level::info};
    query_mode mode{query_mode::preserve};
    text_encoding encoding{text_encoding::automatic};
};

// Comma-separated list of names, whitespace around each name is removed and
// empty names are discarded.
std::vector<std::string> parse_parameter_list(std::string_view list);

// All the parsers below throw configuration_error on invalid input
log_level parse_log_level(std::string_view str);
query_mode parse_query_mode(std::string_view str);
text_encoding parse_encoding(std::string_view str);

// Overrides the fields of the configuration present in the YAML map:
//
//   parameters: [api_key, token]     # or "api_key,token"
//   redaction_string: "<redacted>"
//   log_level: debug
//   query_mode: canonical
//   encoding: utf-8
void load_configuration(const YAML::Node &node, configuration &config);
void load_configuration_file(std::string_view path, configuration &config);

// Checks the invariants which can't be verified while parsing a single field
void validate_configuration(const configuration &config);

} // namespace urlscrub
