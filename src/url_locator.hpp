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
#include <vector>

namespace urlscrub {

struct url_candidate {
    std::string_view value;
    // Offsets within the scanned line, end is one past the last character
    std::size_t begin;
    std::size_t end;
};

// Lazily produces the URL candidates of a single line, from left to right.
// The scanner references both the regex and the line, neither of which may be
// destroyed while the scanner is in use.
class url_scanner {
public:
    url_scanner(const re2::RE2 &regex, std::string_view line) : regex_(regex), line_(line) {}

    std::optional<url_candidate> next();

protected:
    const re2::RE2 &regex_;
    std::string_view line_;
    std::size_t position_{0};
    bool exhausted_{false};
};

// Locates URL-shaped substrings within free-form text. A candidate isn't a
// validated URL, it only has the shape of one:
//
//   http(s)://host-or-[ipv6](:port)(/segment)*(?query)(#fragment)
//
// The character classes are restrictive on purpose so that surrounding
// punctuation, brackets and quotes are left out of the match.
class url_locator {
public:
    url_locator();

    [[nodiscard]] url_scanner scan(std::string_view line) const { return {*regex_, line}; }
    [[nodiscard]] std::vector<url_candidate> find_all(std::string_view line) const;

    static constexpr std::string_view pattern{
        R"(\bhttps?://(?:[a-zA-Z0-9.\-]+|\[[a-fA-F0-9:]+\])(?::[0-9]+)?(?:/[a-zA-Z0-9_@%+.\-]*)*(?:\?[a-zA-Z0-9_@%&+=;\-]*)?(?:#[a-zA-Z0-9_@%&+=;\-]*)?\b)"};

protected:
    std::unique_ptr<re2::RE2> regex_;
};

} // namespace urlscrub
