// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ip_utils.hpp"
#include "uri_utils.hpp"
#include "utils.hpp"

/*
   Parser for the subset of RFC 3986 needed to split a URL into its components:

     URI       = scheme ":" hier-part [ "?" query ] [ "#" fragment ]
     hier-part = "//" authority path-abempty / path-absolute / path-rootless / path-empty
     authority = [ userinfo "@" ] host [ ":" port ]
     host      = "[" IPv6address "]" / IPv4address / reg-name

   Relative references are accepted when they start with "//" or "/".

   Deviations from the RFC:
     - '[' and ']' are accepted within the query, as commonly found in the wild.
     - The port is kept as text and only checked for digits.
     - The parameters of the last path segment (RFC 1808) are split from the
       path, starting at the first ';' of the segment.
*/

namespace urlscrub {

namespace {

constexpr auto npos = std::string_view::npos;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
enum char_class : uint8_t {
    cc_unreserved = 1U << 0U, // ALPHA DIGIT - . _ ~
    cc_subdelim = 1U << 1U,   // ! $ & ' ( ) * + , ; =
    cc_pct = 1U << 2U,        // %
    cc_colon = 1U << 3U,      // :
    cc_at = 1U << 4U,         // @
    cc_slash_question = 1U << 5U,
    cc_brackets = 1U << 6U,
    cc_scheme = 1U << 7U, // ALPHA DIGIT + - .
};

constexpr std::array<uint8_t, 256> build_char_classes()
{
    std::array<uint8_t, 256> table{};
    for (unsigned c = 0; c < table.size(); ++c) {
        const bool alnum =
            (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (alnum || c == '-' || c == '.' || c == '_' || c == '~') {
            table[c] |= cc_unreserved;
        }
        if (alnum || c == '+' || c == '-' || c == '.') {
            table[c] |= cc_scheme;
        }
    }

    for (auto c : std::string_view{"!$&'()*+,;="}) {
        table[static_cast<uint8_t>(c)] |= cc_subdelim;
    }

    table['%'] |= cc_pct;
    table[':'] |= cc_colon;
    table['@'] |= cc_at;
    table['/'] |= cc_slash_question;
    table['?'] |= cc_slash_question;
    table['['] |= cc_brackets;
    table[']'] |= cc_brackets;
    return table;
}
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

constexpr auto char_classes = build_char_classes();

constexpr uint8_t regname_mask = cc_unreserved | cc_subdelim | cc_pct;
constexpr uint8_t userinfo_mask = regname_mask | cc_colon;
constexpr uint8_t pchar_mask = userinfo_mask | cc_at;
constexpr uint8_t fragment_mask = pchar_mask | cc_slash_question;
constexpr uint8_t query_mask = fragment_mask | cc_brackets;

inline bool in_class(char c, uint8_t mask)
{
    return (char_classes[static_cast<uint8_t>(c)] & mask) != 0;
}

enum class parse_state : uint8_t {
    error,
    start,
    scheme,
    hier_part,
    authority,
    userinfo,
    host,
    reg_name,
    ip_literal,
    port,
    path,
    query,
    fragment,
};

void split_path_params(uri_decomposed &decomposed)
{
    auto segment_begin = decomposed.path.rfind('/');
    segment_begin = (segment_begin == npos) ? 0 : segment_begin + 1;

    auto separator = decomposed.path.find(';', segment_begin);
    if (separator == npos) {
        return;
    }

    decomposed.params_index = decomposed.path_index + separator + 1;
    decomposed.params = decomposed.path.substr(separator + 1);
    decomposed.path = decomposed.path.substr(0, separator);
}

} // namespace

std::optional<uri_decomposed> uri_parse(std::string_view uri)
{
    uri_decomposed decomposed;
    decomposed.raw = uri;

    auto state = parse_state::start;
    // State following the authority, as determined by its delimiter
    auto after_authority = parse_state::error;
    std::size_t authority_end = npos;

    std::size_t i = 0;
    while (i < uri.size()) {
        auto current = state;
        // Every state must explicitly choose its successor
        state = parse_state::error;

        switch (current) {
        case parse_state::start:
            if (uri[i] == '/') {
                if (i + 1 < uri.size() && uri[i + 1] == '/') {
                    state = parse_state::authority;
                    i += 2;
                } else {
                    state = parse_state::path;
                }
            } else if (isalpha(uri[i])) {
                state = parse_state::scheme;
            }
            break;
        case parse_state::scheme: {
            const auto begin = i++;
            auto colon = uri.find(':', i);
            if (colon == npos) {
                return std::nullopt;
            }

            for (; i < colon; ++i) {
                if (!in_class(uri[i], cc_scheme)) {
                    return std::nullopt;
                }
            }

            decomposed.scheme = uri.substr(begin, colon - begin);
            i = colon + 1;
            state = parse_state::hier_part;
            break;
        }
        case parse_state::hier_part:
            if (i + 1 < uri.size() && uri[i] == '/' && uri[i + 1] == '/') {
                state = parse_state::authority;
                i += 2;
            } else {
                state = parse_state::path;
            }
            break;
        case parse_state::authority: {
            authority_end = uri.find_first_of("/?#", i);
            if (authority_end == npos) {
                authority_end = uri.size();
            } else if (uri[authority_end] == '/') {
                after_authority = parse_state::path;
            } else if (uri[authority_end] == '?') {
                after_authority = parse_state::query;
            } else {
                after_authority = parse_state::fragment;
            }

            // "//" was found so the authority is present, even if empty
            decomposed.authority.index = i;
            decomposed.authority.raw = uri.substr(i, authority_end - i);

            if (decomposed.authority.raw.empty()) {
                state = after_authority;
            } else if (decomposed.authority.raw.find('@') != npos) {
                state = parse_state::userinfo;
            } else {
                state = parse_state::host;
            }
            break;
        }
        case parse_state::userinfo: {
            const auto at = uri.find('@', i);
            for (auto j = i; j < at; ++j) {
                if (!in_class(uri[j], userinfo_mask)) {
                    return std::nullopt;
                }
            }

            decomposed.authority.userinfo = uri.substr(i, at - i);
            i = at + 1;
            state = (i == authority_end) ? after_authority : parse_state::host;
            break;
        }
        case parse_state::host:
            if (uri[i] == '[') {
                state = parse_state::ip_literal;
            } else if (uri[i] == ':') {
                // Empty host
                ++i;
                state = parse_state::port;
            } else if (in_class(uri[i], regname_mask)) {
                state = parse_state::reg_name;
            } else {
                return std::nullopt;
            }
            break;
        case parse_state::reg_name: {
            const auto begin = i;
            for (; i < authority_end && uri[i] != ':'; ++i) {
                if (!in_class(uri[i], regname_mask)) {
                    return std::nullopt;
                }
            }

            decomposed.authority.host = uri.substr(begin, i - begin);
            decomposed.authority.host_index = begin;

            if (i < authority_end) {
                // Skip the ':' preceding the port
                ++i;
                state = parse_state::port;
            } else {
                state = after_authority;
            }
            break;
        }
        case parse_state::ip_literal: {
            const auto begin = ++i;
            for (; i < authority_end && uri[i] != ']'; ++i) {
                if (!isxdigit(uri[i]) && uri[i] != ':' && uri[i] != '.') {
                    return std::nullopt;
                }
            }

            if (i >= authority_end || i == begin) {
                // Missing terminator or empty literal
                return std::nullopt;
            }

            auto host = uri.substr(begin, i - begin);
            if (!is_ipv6_address(host)) {
                return std::nullopt;
            }

            decomposed.authority.host = host;
            decomposed.authority.host_index = begin;

            ++i; // Skip ']'
            if (i == authority_end) {
                state = after_authority;
            } else if (uri[i] == ':') {
                ++i;
                state = parse_state::port;
            } else {
                return std::nullopt;
            }
            break;
        }
        case parse_state::port: {
            const auto begin = i;
            for (; i < authority_end; ++i) {
                if (!isdigit(uri[i])) {
                    return std::nullopt;
                }
            }

            decomposed.authority.port = uri.substr(begin, i - begin);
            state = after_authority;
            break;
        }
        case parse_state::path: {
            const auto begin = i;
            for (; i < uri.size() && uri[i] != '?' && uri[i] != '#'; ++i) {
                if (!in_class(uri[i], pchar_mask) && uri[i] != '/') {
                    return std::nullopt;
                }
            }

            decomposed.path_index = begin;
            decomposed.path = uri.substr(begin, i - begin);
            split_path_params(decomposed);

            if (i < uri.size()) {
                state = uri[i] == '?' ? parse_state::query : parse_state::fragment;
            }
            break;
        }
        case parse_state::query: {
            const auto begin = ++i;
            for (; i < uri.size() && uri[i] != '#'; ++i) {
                if (!in_class(uri[i], query_mask)) {
                    return std::nullopt;
                }
            }

            decomposed.query_index = begin;
            decomposed.query = uri.substr(begin, i - begin);
            if (i < uri.size()) {
                state = parse_state::fragment;
            }
            break;
        }
        case parse_state::fragment: {
            const auto begin = ++i;
            for (; i < uri.size(); ++i) {
                if (!in_class(uri[i], fragment_mask)) {
                    return std::nullopt;
                }
            }

            decomposed.fragment_index = begin;
            decomposed.fragment = uri.substr(begin);
            break;
        }
        case parse_state::error:
        default:
            return std::nullopt;
        }
    }

    return decomposed;
}

std::string uri_compose(const uri_decomposed &uri, std::string_view query)
{
    std::string output;
    output.reserve(uri.raw.size() - uri.query.size() + query.size() + 1);

    if (!uri.scheme.empty()) {
        output.append(uri.scheme);
        output.push_back(':');
    }

    if (uri.authority.index != npos) {
        output.append("//");
        output.append(uri.authority.raw);
    }

    output.append(uri.path);

    if (uri.params_index != npos) {
        output.push_back(';');
        output.append(uri.params);
    }

    if (uri.query_index != npos || !query.empty()) {
        output.push_back('?');
        output.append(query);
    }

    if (uri.fragment_index != npos) {
        output.push_back('#');
        output.append(uri.fragment);
    }

    return output;
}

} // namespace urlscrub
