// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "log.hpp"
#include "regex_utils.hpp"
#include "url_locator.hpp"

namespace urlscrub {

std::optional<url_candidate> url_scanner::next()
{
    if (exhausted_) {
        return std::nullopt;
    }

    auto match = regex_find(regex_, line_, position_);
    if (!match.has_value() || match->empty()) {
        exhausted_ = true;
        return std::nullopt;
    }

    const auto begin = static_cast<std::size_t>(match->data() - line_.data());
    const auto end = begin + match->size();

    // Matches never overlap, the next scan starts where this one ended
    position_ = end;

    URLSCRUB_TRACE("URL candidate found at [{}, {})", begin, end);

    return url_candidate{*match, begin, end};
}

url_locator::url_locator() : regex_(regex_init(pattern, true, true)) {}

std::vector<url_candidate> url_locator::find_all(std::string_view line) const
{
    std::vector<url_candidate> candidates;

    auto scanner = scan(line);
    while (auto candidate = scanner.next()) { candidates.emplace_back(*candidate); }

    return candidates;
}

} // namespace urlscrub
