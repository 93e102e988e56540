// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace urlscrub {

enum class query_mode : uint8_t {
    // Redact in place, every other byte of the query is kept
    preserve,
    // Rebuild the query from its decoded parameters, grouped by name
    canonical,
};

enum class redaction_status : uint8_t { unchanged, redacted, malformed };

struct redaction_result {
    std::string value;
    redaction_status status{redaction_status::unchanged};
};

// Replaces the values of a set of query parameters with a fixed token. The
// parameter names are matched exactly, after decoding, against the names
// found in the query.
class redactor {
public:
    redactor(std::vector<std::string> parameters, std::string redaction_string,
        query_mode mode = query_mode::preserve);
    redactor(const redactor &) = default;
    redactor(redactor &&) noexcept = default;
    redactor &operator=(const redactor &) = default;
    redactor &operator=(redactor &&) noexcept = default;
    virtual ~redactor() = default;

    // The input URL is returned as is when it can't be parsed or when none of
    // its parameters require redaction.
    [[nodiscard]] virtual redaction_result redact(std::string_view url) const;

    [[nodiscard]] bool is_sensitive(const std::string &name) const
    {
        return lookup_.contains(name);
    }

    [[nodiscard]] const std::vector<std::string> &parameters() const { return parameters_; }
    [[nodiscard]] const std::string &redaction_string() const { return redaction_string_; }
    [[nodiscard]] query_mode mode() const { return mode_; }

    static constexpr std::string_view default_redaction_string{"REDACTED"};

protected:
    [[nodiscard]] std::string redact_in_place(std::string_view query, bool &found) const;
    [[nodiscard]] std::string redact_canonical(std::string_view query, bool &found) const;

    std::vector<std::string> parameters_;
    std::unordered_set<std::string> lookup_;
    std::string redaction_string_;
    std::string encoded_redaction_string_;
    query_mode mode_;
};

std::string redact_url(std::string_view url, const std::vector<std::string> &parameters,
    std::string_view redaction_string = redactor::default_redaction_string);

} // namespace urlscrub
