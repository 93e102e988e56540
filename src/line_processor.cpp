// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "line_processor.hpp"
#include "log.hpp"

namespace urlscrub {

line_processor::line_processor(
    std::vector<std::string> parameters, std::string redaction_string, query_mode mode)
    : redactor_(
          std::make_unique<redactor>(std::move(parameters), std::move(redaction_string), mode))
{}

line_processor::line_processor(std::unique_ptr<redactor> instance) : redactor_(std::move(instance))
{
    if (!redactor_) {
        throw std::invalid_argument("line_processor requires a redactor");
    }
}

line_result line_processor::process(std::string_view line) const
{
    line_result result;

    try {
        std::string output;
        output.reserve(line.size());

        std::size_t copied = 0;
        auto scanner = locator_.scan(line);
        while (auto candidate = scanner.next()) {
            ++result.stats.urls_found;

            output.append(line.substr(copied, candidate->begin - copied));

            auto redacted = redactor_->redact(candidate->value);
            switch (redacted.status) {
            case redaction_status::malformed:
                // The candidate itself isn't logged as it might contain sensitive data
                URLSCRUB_WARN("Malformed URL at offset {} (length {}), leaving it unmodified",
                    candidate->begin, candidate->value.size());
                ++result.stats.urls_malformed;
                break;
            case redaction_status::redacted:
                URLSCRUB_DEBUG("Redacted URL at offset {}", candidate->begin);
                ++result.stats.urls_redacted;
                break;
            case redaction_status::unchanged:
                break;
            }

            output.append(redacted.value);
            copied = candidate->end;
        }

        output.append(line.substr(copied));
        result.text = std::move(output);
    } catch (const std::exception &e) {
        URLSCRUB_ERROR("Failed to process line, leaving it unmodified: {}", e.what());
        result.text = std::string{line};
        result.stats = {};
        result.failed = true;
    }

    return result;
}

} // namespace urlscrub
