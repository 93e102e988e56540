// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace urlscrub {

// A single element of a query string, as delimited by '&'. The raw views
// point into the parsed query, the name is decoded.
struct query_parameter {
    std::string_view raw;
    std::string_view raw_name;
    std::string_view raw_value;
    bool has_value{false};
    std::string name;
};

// Splits the query on '&', empty elements are kept so that the same
// query can be rebuilt by joining the raw views.
std::vector<query_parameter> query_split(std::string_view query);

// application/x-www-form-urlencoded decoding: '+' becomes a space and valid
// percent-encoded sequences are decoded, anything else is copied as is.
std::string form_decode(std::string_view str);

// application/x-www-form-urlencoded encoding: alphanumerics and "_.-~" are
// kept, spaces become '+' and everything else is percent-encoded.
std::string form_encode(std::string_view str);

} // namespace urlscrub
