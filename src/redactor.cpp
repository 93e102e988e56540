// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "query_string.hpp"
#include "redactor.hpp"
#include "uri_utils.hpp"

namespace urlscrub {

namespace {

// Form encoding leaves '.' and '~' as they are, but neither belongs to the
// query of a URL candidate. Escaping them keeps a redacted URL a single
// candidate when the text is scanned again.
std::string encode_redaction_string(std::string_view token)
{
    std::string encoded;
    for (const auto c : form_encode(token)) {
        if (c == '.') {
            encoded.append("%2E");
        } else if (c == '~') {
            encoded.append("%7E");
        } else {
            encoded.push_back(c);
        }
    }
    return encoded;
}

} // namespace

redactor::redactor(
    std::vector<std::string> parameters, std::string redaction_string, query_mode mode)
    : parameters_(std::move(parameters)), lookup_(parameters_.begin(), parameters_.end()),
      redaction_string_(std::move(redaction_string)),
      encoded_redaction_string_(encode_redaction_string(redaction_string_)), mode_(mode)
{}

redaction_result redactor::redact(std::string_view url) const
{
    auto decomposed = uri_parse(url);
    if (!decomposed.has_value()) {
        return {std::string{url}, redaction_status::malformed};
    }

    if (decomposed->query.empty()) {
        return {std::string{url}, redaction_status::unchanged};
    }

    bool found = false;
    auto query = mode_ == query_mode::preserve ? redact_in_place(decomposed->query, found)
                                               : redact_canonical(decomposed->query, found);
    if (!found) {
        return {std::string{url}, redaction_status::unchanged};
    }

    return {uri_compose(*decomposed, query), redaction_status::redacted};
}

std::string redactor::redact_in_place(std::string_view query, bool &found) const
{
    std::string output;
    output.reserve(query.size());

    // Names which have already been redacted, further occurrences are removed
    // so that each of them ends up with a single value
    std::unordered_set<std::string> redacted;

    bool first = true;
    for (const auto &param : query_split(query)) {
        if (is_sensitive(param.name)) {
            found = true;
            if (!redacted.emplace(param.name).second) {
                continue;
            }

            if (!first) {
                output.push_back('&');
            }
            output.append(param.raw_name);
            output.push_back('=');
            output.append(encoded_redaction_string_);
        } else {
            if (!first) {
                output.push_back('&');
            }
            output.append(param.raw);
        }
        first = false;
    }

    return output;
}

std::string redactor::redact_canonical(std::string_view query, bool &found) const
{
    // Parameters grouped by name, in order of first appearance
    std::vector<std::pair<std::string, std::vector<std::string>>> groups;
    std::unordered_map<std::string, std::size_t> index;

    for (auto &param : query_split(query)) {
        // Blank values are discarded
        if (!param.has_value || param.raw_value.empty()) {
            continue;
        }

        auto [it, inserted] = index.emplace(param.name, groups.size());
        if (inserted) {
            groups.emplace_back(std::move(param.name), std::vector<std::string>{});
        }
        groups[it->second].second.emplace_back(form_decode(param.raw_value));
    }

    std::string output;
    output.reserve(query.size());
    for (const auto &[name, values] : groups) {
        auto encoded_name = form_encode(name);
        if (is_sensitive(name)) {
            // A single value is kept for redacted names
            found = true;
            if (!output.empty()) {
                output.push_back('&');
            }
            output.append(encoded_name);
            output.push_back('=');
            output.append(encoded_redaction_string_);
            continue;
        }

        for (const auto &value : values) {
            if (!output.empty()) {
                output.push_back('&');
            }
            output.append(encoded_name);
            output.push_back('=');
            output.append(form_encode(value));
        }
    }

    return output;
}

std::string redact_url(std::string_view url, const std::vector<std::string> &parameters,
    std::string_view redaction_string)
{
    const redactor instance{parameters, std::string{redaction_string}};
    return instance.redact(url).value;
}

} // namespace urlscrub
