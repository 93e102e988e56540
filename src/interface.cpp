// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "configuration.hpp"
#include "line_processor.hpp"
#include "log.hpp"
#include "redactor.hpp"
#include "urlscrub.h"
#include "version.hpp"

using namespace urlscrub;

static_assert(static_cast<URLSCRUB_QUERY_MODE>(query_mode::preserve) == URLSCRUB_QUERY_PRESERVE);
static_assert(static_cast<URLSCRUB_QUERY_MODE>(query_mode::canonical) == URLSCRUB_QUERY_CANONICAL);

namespace {
urlscrub::line_processor *processor_from_config(const urlscrub_config *config)
{
    const configuration defaults;
    if (config == nullptr) {
        return new line_processor(defaults.parameters, defaults.redaction_string, defaults.mode);
    }

    if (config->parameters_size > 0 && config->parameters == nullptr) {
        URLSCRUB_ERROR("Invalid configuration: null parameter list with non-zero size");
        return nullptr;
    }

    std::vector<std::string> parameters;
    parameters.reserve(config->parameters_size);
    for (uint32_t i = 0; i < config->parameters_size; ++i) {
        const char *name = config->parameters[i];
        if (name == nullptr || *name == '\0') {
            URLSCRUB_WARN("Ignoring empty parameter name at index {}", i);
            continue;
        }
        parameters.emplace_back(name);
    }

    std::string redaction_string = config->redaction_string != nullptr
                                       ? std::string{config->redaction_string}
                                       : defaults.redaction_string;

    query_mode mode = defaults.mode;
    switch (config->query_mode) {
    case URLSCRUB_QUERY_PRESERVE:
        mode = query_mode::preserve;
        break;
    case URLSCRUB_QUERY_CANONICAL:
        mode = query_mode::canonical;
        break;
    default:
        URLSCRUB_ERROR("Invalid configuration: unknown query mode {}",
            static_cast<int>(config->query_mode));
        return nullptr;
    }

    validate_configuration({.parameters = parameters,
        .redaction_string = redaction_string,
        .level = defaults.level,
        .mode = mode,
        .encoding = defaults.encoding});

    return new line_processor(std::move(parameters), std::move(redaction_string), mode);
}

} // namespace

extern "C" {

urlscrub::line_processor *urlscrub_init(const urlscrub_config *config)
{
    try {
        return processor_from_config(config);
    } catch (const std::exception &e) {
        URLSCRUB_ERROR("{}", e.what());
    } catch (...) {
        URLSCRUB_ERROR("unknown exception");
    }

    return nullptr;
}

void urlscrub_destroy(urlscrub::line_processor *handle)
{
    try {
        delete handle;
    } catch (const std::exception &e) {
        URLSCRUB_ERROR("{}", e.what());
    } catch (...) {
        URLSCRUB_ERROR("unknown exception");
    }
}

URLSCRUB_RET_CODE urlscrub_redact_line(
    urlscrub::line_processor *handle, const char *line, size_t length, urlscrub_result *result)
{
    if (handle == nullptr || (line == nullptr && length > 0) || result == nullptr) {
        URLSCRUB_WARN("Illegal call to urlscrub_redact_line: null argument");
        return URLSCRUB_ERR_INVALID_ARGUMENT;
    }

    try {
        auto processed = handle->process(std::string_view{line, length});

        // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
        auto *text = static_cast<char *>(malloc(processed.text.size() + 1));
        if (text == nullptr) {
            return URLSCRUB_ERR_INTERNAL;
        }
        memcpy(text, processed.text.data(), processed.text.size());
        text[processed.text.size()] = '\0';

        constexpr std::size_t max_count = std::numeric_limits<uint32_t>::max();
        result->text = text;
        result->length = processed.text.size();
        result->urls_found = static_cast<uint32_t>(std::min(processed.stats.urls_found, max_count));
        result->urls_redacted =
            static_cast<uint32_t>(std::min(processed.stats.urls_redacted, max_count));
        result->urls_malformed =
            static_cast<uint32_t>(std::min(processed.stats.urls_malformed, max_count));

        return processed.stats.urls_redacted > 0 ? URLSCRUB_REDACTED : URLSCRUB_OK;
    } catch (const std::exception &e) {
        URLSCRUB_ERROR("{}", e.what());
    } catch (...) {
        URLSCRUB_ERROR("unknown exception");
    }

    return URLSCRUB_ERR_INTERNAL;
}

void urlscrub_result_free(urlscrub_result *result)
{
    if (result == nullptr) {
        return;
    }

    // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
    free(result->text);
    result->text = nullptr;
    result->length = 0;
}

const char *urlscrub_get_version() { return urlscrub::current_version.data(); }

bool urlscrub_set_log_cb(urlscrub_log_cb cb, URLSCRUB_LOG_LEVEL min_level)
{
    urlscrub::logger::init(cb, static_cast<urlscrub::log_level>(min_level));
    URLSCRUB_INFO("Sending log messages to binding, min level {}",
        log_level_to_str(static_cast<log_level>(min_level)));
    return true;
}

} // extern "C"
