// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <string_view>
#include <vector>

#include "utils.hpp"

namespace urlscrub {

std::vector<std::string_view> split(std::string_view str, char sep)
{
    std::vector<std::string_view> components;

    while (!str.empty()) {
        const auto end = str.find(sep);
        // Empty components are skipped
        if (auto component = str.substr(0, end); !component.empty()) {
            components.emplace_back(component);
        }

        if (end == std::string_view::npos) {
            break;
        }
        str.remove_prefix(end + 1);
    }

    return components;
}

std::string_view trim(std::string_view str)
{
    while (!str.empty() && isspace(str.front())) { str.remove_prefix(1); }
    while (!str.empty() && isspace(str.back())) { str.remove_suffix(1); }
    return str;
}

bool string_iequals(std::string_view left, std::string_view right)
{
    return left.size() == right.size() &&
           std::equal(left.begin(), left.end(), right.begin(),
               [](char l, char r) { return tolower(l) == tolower(r); });
}

} // namespace urlscrub
