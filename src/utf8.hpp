// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2022 Datadog, Inc.

#pragma once

#include <cstdint>

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define UTF8_MAX_CODEPOINT 0x10FFFF
#define UTF8_INVALID 0xFFFFFFFF
#define UTF8_EOF 0xFFFFFFFE
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace urlscrub::utf8 {

// Decodes the codepoint starting at position and moves past it. Invalid
// sequences yield UTF8_INVALID and only skip their first byte, the end of the
// buffer yields UTF8_EOF.
uint32_t fetch_next_codepoint(const char *buffer, uint64_t &position, uint64_t length);

} // namespace urlscrub::utf8
