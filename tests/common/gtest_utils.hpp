// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.
#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "urlscrub.h"

#define EXPECT_STR(a, b) EXPECT_EQ(std::string_view{a}, std::string_view{b})
#define EXPECT_STRV(a, b) EXPECT_STR(a, b)

namespace urlscrub::test {

// A single redaction scenario, as found in the integration YAML files:
//
//   - name: example
//     parameters: [api_key]        # optional
//     redaction_string: REDACTED   # optional
//     query_mode: preserve         # optional
//     input: "..."
//     output: "..."
//     code: redacted               # ok or redacted, optional
//     stats: {found: 1, redacted: 1, malformed: 0}  # optional
struct redaction_case {
    struct counters {
        uint32_t found{0};
        uint32_t redacted{0};
        uint32_t malformed{0};
    };

    std::string name;
    std::optional<std::vector<std::string>> parameters;
    std::optional<std::string> redaction_string;
    URLSCRUB_QUERY_MODE query_mode{URLSCRUB_QUERY_PRESERVE};
    std::string input;
    std::string output;
    std::optional<URLSCRUB_RET_CODE> code;
    std::optional<counters> stats;
};

::std::ostream &operator<<(::std::ostream &os, const redaction_case &c);

std::string read_file(std::string_view filename, std::string_view base = "./");
YAML::Node read_yaml_file(std::string_view filename, std::string_view base = "./");

} // namespace urlscrub::test

namespace YAML {

template <> struct as_if<urlscrub::test::redaction_case, void> {
    explicit as_if(const Node &node_) : node(node_) {}
    urlscrub::test::redaction_case operator()() const;
    const Node &node;
};

} // namespace YAML
