// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "urlscrub.h"

// Writes to stderr so that diagnostics never mix with redacted output
void log_cb(URLSCRUB_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);

// Reads the whole file as raw bytes, throws std::system_error on failure
std::string read_file(std::string_view filename);
