// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "redactor.hpp"
#include "url_locator.hpp"

namespace urlscrub {

struct line_stats {
    std::size_t urls_found{0};
    std::size_t urls_redacted{0};
    std::size_t urls_malformed{0};

    line_stats &operator+=(const line_stats &other)
    {
        urls_found += other.urls_found;
        urls_redacted += other.urls_redacted;
        urls_malformed += other.urls_malformed;
        return *this;
    }
};

struct line_result {
    std::string text;
    line_stats stats;
    // Processing was abandoned and the text is the input line
    bool failed{false};
};

// Rewrites a line of text, redacting every URL found within it. Lines are
// independent of each other so a single instance can process any number of
// them, in any order.
class line_processor {
public:
    line_processor(std::vector<std::string> parameters, std::string redaction_string,
        query_mode mode = query_mode::preserve);
    explicit line_processor(std::unique_ptr<redactor> instance);

    // Never throws, a line which can't be processed is returned unchanged and
    // flagged as failed.
    [[nodiscard]] line_result process(std::string_view line) const;

    [[nodiscard]] const redactor &get_redactor() const { return *redactor_; }

protected:
    url_locator locator_;
    std::unique_ptr<redactor> redactor_;
};

} // namespace urlscrub
