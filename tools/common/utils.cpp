// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/core.h>

#include "log.hpp"
#include "urlscrub.h"
#include "utils.hpp"

void log_cb(URLSCRUB_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length)
{
    fmt::print(stderr, "[{}][{}:{}:{}]: {}\n",
        urlscrub::log_level_to_str(static_cast<urlscrub::log_level>(level)), file, function, line,
        std::string_view{message, static_cast<std::size_t>(length)});
}

std::string read_file(std::string_view filename)
{
    std::ifstream file(std::string{filename}, std::ios::in | std::ios::binary);
    if (!file) {
        throw std::system_error(errno, std::generic_category(), std::string{filename});
    }

    std::string contents{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    if (file.bad()) {
        throw std::system_error(errno, std::generic_category(), std::string{filename});
    }

    return contents;
}
