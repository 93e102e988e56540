// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "query_string.hpp"
#include "utils.hpp"

namespace urlscrub {

namespace {

inline bool is_form_safe(char c)
{
    return urlscrub::isalnum(c) || c == '_' || c == '.' || c == '-' || c == '~';
}

} // namespace

std::vector<query_parameter> query_split(std::string_view query)
{
    std::vector<query_parameter> parameters;

    std::size_t start = 0;
    while (true) {
        auto end = query.find('&', start);
        if (end == std::string_view::npos) {
            end = query.size();
        }

        query_parameter param;
        param.raw = query.substr(start, end - start);

        auto equal = param.raw.find('=');
        if (equal != std::string_view::npos) {
            param.raw_name = param.raw.substr(0, equal);
            param.raw_value = param.raw.substr(equal + 1);
            param.has_value = true;
        } else {
            param.raw_name = param.raw;
        }
        param.name = form_decode(param.raw_name);

        parameters.emplace_back(std::move(param));

        if (end >= query.size()) {
            break;
        }
        start = end + 1;
    }

    return parameters;
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
std::string form_decode(std::string_view str)
{
    std::string output;
    output.reserve(str.size());

    std::size_t read = 0;
    while (read < str.size()) {
        const auto c = str[read];
        if (c == '+') {
            output.push_back(' ');
            read += 1;
        } else if (c == '%' && read + 2 < str.size() && urlscrub::isxdigit(str[read + 1]) &&
                   urlscrub::isxdigit(str[read + 2])) {
            const uint8_t high_bits = from_hex(str[read + 1]);
            const uint8_t low_bits = from_hex(str[read + 2]);
            output.push_back(static_cast<char>(high_bits << 4U | low_bits));
            read += 3;
        } else {
            // Includes stray '%' which aren't followed by two hex digits
            output.push_back(c);
            read += 1;
        }
    }

    return output;
}

std::string form_encode(std::string_view str)
{
    std::string output;
    output.reserve(str.size());

    for (const auto c : str) {
        if (is_form_safe(c)) {
            output.push_back(c);
        } else if (c == ' ') {
            output.push_back('+');
        } else {
            const auto uc = static_cast<uint8_t>(c);
            output.push_back('%');
            output.push_back(to_hex(uc >> 4U));
            output.push_back(to_hex(uc & 0x0FU));
        }
    }

    return output;
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace urlscrub
