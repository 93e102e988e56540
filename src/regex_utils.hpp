// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <re2/re2.h>
#include <string_view>

namespace urlscrub {

std::unique_ptr<re2::RE2> regex_init(
    std::string_view pattern, bool case_sensitive = false, bool longest_match = false);

// Finds the first match of the regex in subject starting at the given offset,
// the text preceding the offset is still used as context for \b and ^.
std::optional<std::string_view> regex_find(
    const re2::RE2 &regex, std::string_view subject, std::size_t offset);

} // namespace urlscrub
