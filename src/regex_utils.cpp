// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "regex_utils.hpp"

namespace urlscrub {

std::unique_ptr<re2::RE2> regex_init(
    std::string_view pattern, bool case_sensitive, bool longest_match)
{
    re2::RE2::Options options;
    options.set_log_errors(false);
    options.set_case_sensitive(case_sensitive);
    options.set_longest_match(longest_match);

    auto regex =
        std::make_unique<re2::RE2>(re2::StringPiece{pattern.data(), pattern.size()}, options);
    if (!regex->ok()) {
        throw std::runtime_error(fmt::format("failed to compile regex '{}': {} at '{}'", pattern,
            regex->error(), regex->error_arg()));
    }
    return regex;
}

std::optional<std::string_view> regex_find(
    const re2::RE2 &regex, std::string_view subject, std::size_t offset)
{
    if (offset > subject.size()) {
        return std::nullopt;
    }

    const re2::StringPiece subject_ref(subject.data(), subject.size());
    re2::StringPiece match;
    if (!regex.Match(subject_ref, offset, subject_ref.size(), re2::RE2::UNANCHORED, &match, 1)) {
        return std::nullopt;
    }

    return std::string_view{match.data(), match.size()};
}

} // namespace urlscrub
