// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <array>
#include <cstdint>

#include "utf8.hpp"

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
namespace urlscrub::utf8 {

namespace {

constexpr bool is_continuation(uint8_t byte) { return (byte & 0xC0U) == 0x80U; }
constexpr bool is_surrogate(uint32_t codepoint)
{
    return codepoint >= 0xD800 && codepoint <= 0xDFFF;
}

// Length of the sequence announced by the leading byte, or 0 if the byte can't
// start a sequence (continuation bytes, 0xC0, 0xC1 and 0xF5 onwards).
constexpr uint8_t sequence_length(uint8_t lead)
{
    if (lead < 0x80U) {
        return 1;
    }
    if (lead >= 0xC2U && lead <= 0xDFU) {
        return 2;
    }
    if ((lead & 0xF0U) == 0xE0U) {
        return 3;
    }
    if (lead >= 0xF0U && lead <= 0xF4U) {
        return 4;
    }
    return 0;
}

// Smallest codepoint which requires a sequence of the given length
constexpr std::array<uint32_t, 5> minimum_codepoint{0, 0, 0x80, 0x800, 0x10000};

} // namespace

uint32_t fetch_next_codepoint(const char *buffer, uint64_t &position, uint64_t length)
{
    if (position >= length) {
        return UTF8_EOF;
    }

    const auto lead = static_cast<uint8_t>(buffer[position]);
    const auto expected = sequence_length(lead);
    if (expected == 0 || expected > length - position) {
        ++position;
        return UTF8_INVALID;
    }

    if (expected == 1) {
        ++position;
        return lead;
    }

    // The leading byte carries 7 - expected bits of payload
    uint32_t codepoint = lead & (0x7FU >> expected);
    for (uint8_t i = 1; i < expected; ++i) {
        const auto byte = static_cast<uint8_t>(buffer[position + i]);
        if (!is_continuation(byte)) {
            ++position;
            return UTF8_INVALID;
        }
        codepoint = (codepoint << 6U) | (byte & 0x3FU);
    }

    // Overlong forms and encoded surrogates are rejected
    if (codepoint < minimum_codepoint[expected] || codepoint > UTF8_MAX_CODEPOINT ||
        is_surrogate(codepoint)) {
        ++position;
        return UTF8_INVALID;
    }

    position += expected;
    return codepoint;
}

} // namespace urlscrub::utf8
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
