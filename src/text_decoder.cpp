// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2022 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <unicode/ucnv.h>
#include <unicode/ucsdet.h>
#include <unicode/ustring.h>
#include <unicode/utypes.h>

#include "log.hpp"
#include "text_decoder.hpp"
#include "utf8.hpp"
#include "utils.hpp"

using namespace std::literals;

namespace urlscrub {

namespace {

constexpr std::string_view utf8_charset{"UTF-8"};
constexpr std::string_view utf16le_charset{"UTF-16LE"};
constexpr std::string_view utf16be_charset{"UTF-16BE"};
constexpr std::string_view latin1_charset{"ISO-8859-1"};

constexpr std::string_view utf8_bom{"\xEF\xBB\xBF"};
constexpr std::string_view utf16le_bom{"\xFF\xFE"};
constexpr std::string_view utf16be_bom{"\xFE\xFF"};

constexpr UChar32 replacement_character = 0xFFFD;

// Guesses below this confidence, out of 100, are ignored
constexpr int32_t min_detection_confidence = 50;
// Only the beginning of a buffer is handed to the detector
constexpr std::size_t detection_sample_size = 64 * 1024;

int32_t checked_length(std::size_t size)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
        throw std::runtime_error(fmt::format("buffer of {} bytes is too large to convert", size));
    }
    return static_cast<int32_t>(size);
}

[[noreturn]] void throw_icu_error(std::string_view what, UErrorCode status)
{
    throw std::runtime_error(fmt::format("{}: {}", what, u_errorName(status)));
}

bool is_convertible(const char *charset)
{
    UErrorCode status = U_ZERO_ERROR;
    const icu::LocalUConverterPointer converter{ucnv_open(charset, &status)};
    return U_SUCCESS(status);
}

std::string_view strip_bom(std::string_view bytes, std::string_view charset)
{
    std::string_view bom;
    if (charset == utf8_charset) {
        bom = utf8_bom;
    } else if (charset == utf16le_charset) {
        bom = utf16le_bom;
    } else if (charset == utf16be_charset) {
        bom = utf16be_bom;
    }

    if (!bom.empty() && bytes.starts_with(bom)) {
        bytes.remove_prefix(bom.size());
    }
    return bytes;
}

std::u16string to_utf16(std::string_view bytes, const std::string &charset)
{
    UErrorCode status = U_ZERO_ERROR;
    const icu::LocalUConverterPointer converter{ucnv_open(charset.c_str(), &status)};
    if (U_FAILURE(status)) {
        throw_icu_error(fmt::format("failed to open a converter for {}", charset), status);
    }

    const auto length = checked_length(bytes.size());

    // Single and double byte charsets never need more code units than bytes,
    // anything else is retried with the required capacity
    std::u16string output(bytes.size(), u'\0');
    auto written = ucnv_toUChars(converter.getAlias(), output.data(),
        checked_length(output.size()), bytes.data(), length, &status);
    if (status == U_BUFFER_OVERFLOW_ERROR) {
        status = U_ZERO_ERROR;
        output.resize(static_cast<std::size_t>(written));
        written = ucnv_toUChars(converter.getAlias(), output.data(), written, bytes.data(),
            length, &status);
    }

    if (U_FAILURE(status)) {
        throw_icu_error(fmt::format("failed to convert from {}", charset), status);
    }

    output.resize(static_cast<std::size_t>(written));
    return output;
}

std::string to_utf8(const std::u16string &text)
{
    UErrorCode status = U_ZERO_ERROR;
    const auto length = checked_length(text.size());

    int32_t required = 0;
    u_strToUTF8WithSub(
        nullptr, 0, &required, text.data(), length, replacement_character, nullptr, &status);
    if (U_FAILURE(status) && status != U_BUFFER_OVERFLOW_ERROR) {
        throw_icu_error("failed to convert to UTF-8", status);
    }

    std::string output(static_cast<std::size_t>(required), '\0');
    status = U_ZERO_ERROR;
    u_strToUTF8WithSub(output.data(), required, &required, text.data(), length,
        replacement_character, nullptr, &status);
    if (U_FAILURE(status)) {
        throw_icu_error("failed to convert to UTF-8", status);
    }

    return output;
}

} // namespace

std::optional<text_encoding> encoding_from_string(std::string_view str)
{
    if (string_iequals(str, "auto"sv)) {
        return text_encoding::automatic;
    }

    if (string_iequals(str, "utf-8"sv) || string_iequals(str, "utf8"sv)) {
        return text_encoding::utf8;
    }

    if (string_iequals(str, "utf-16le"sv) || string_iequals(str, "utf16le"sv)) {
        return text_encoding::utf16le;
    }

    if (string_iequals(str, "utf-16be"sv) || string_iequals(str, "utf16be"sv)) {
        return text_encoding::utf16be;
    }

    if (string_iequals(str, "latin-1"sv) || string_iequals(str, "latin1"sv) ||
        string_iequals(str, "iso-8859-1"sv)) {
        return text_encoding::latin1;
    }

    return std::nullopt;
}

std::string_view encoding_to_string(text_encoding encoding)
{
    switch (encoding) {
    case text_encoding::utf8:
        return "utf-8";
    case text_encoding::utf16le:
        return "utf-16le";
    case text_encoding::utf16be:
        return "utf-16be";
    case text_encoding::latin1:
        return "latin-1";
    case text_encoding::automatic:
        break;
    }
    return "auto";
}

std::optional<std::string_view> encoding_charset(text_encoding encoding)
{
    switch (encoding) {
    case text_encoding::utf8:
        return utf8_charset;
    case text_encoding::utf16le:
        return utf16le_charset;
    case text_encoding::utf16be:
        return utf16be_charset;
    case text_encoding::latin1:
        return latin1_charset;
    case text_encoding::automatic:
        break;
    }
    return std::nullopt;
}

bool is_valid_utf8(std::string_view bytes)
{
    uint64_t position = 0;
    while (position < bytes.size()) {
        if (utf8::fetch_next_codepoint(bytes.data(), position, bytes.size()) == UTF8_INVALID) {
            return false;
        }
    }
    return true;
}

std::string detect_charset(std::string_view bytes)
{
    if (bytes.starts_with(utf8_bom)) {
        return std::string{utf8_charset};
    }

    if (bytes.starts_with(utf16le_bom)) {
        return std::string{utf16le_charset};
    }

    if (bytes.starts_with(utf16be_bom)) {
        return std::string{utf16be_charset};
    }

    if (is_valid_utf8(bytes)) {
        return std::string{utf8_charset};
    }

    // ICU calls are no-ops once status holds an error
    UErrorCode status = U_ZERO_ERROR;
    const icu::LocalUCharsetDetectorPointer detector{ucsdet_open(&status)};

    const auto sample = bytes.substr(0, detection_sample_size);
    ucsdet_setText(
        detector.getAlias(), sample.data(), static_cast<int32_t>(sample.size()), &status);

    const UCharsetMatch *match = ucsdet_detect(detector.getAlias(), &status);
    if (U_FAILURE(status) || match == nullptr) {
        URLSCRUB_DEBUG("Charset detection failed ({}), assuming {}", u_errorName(status),
            latin1_charset);
        return std::string{latin1_charset};
    }

    const auto confidence = ucsdet_getConfidence(match, &status);
    const char *name = ucsdet_getName(match, &status);
    if (U_FAILURE(status) || name == nullptr) {
        return std::string{latin1_charset};
    }

    if (confidence < min_detection_confidence || !is_convertible(name)) {
        URLSCRUB_DEBUG("Ignoring detected charset {} (confidence {}), assuming {}", name,
            confidence, latin1_charset);
        return std::string{latin1_charset};
    }

    return std::string{name};
}

std::string decode_to_utf8(std::string_view bytes, text_encoding encoding)
{
    std::string charset;
    if (auto name = encoding_charset(encoding); name.has_value()) {
        charset = *name;
    } else {
        charset = detect_charset(bytes);
        URLSCRUB_DEBUG("Detected input charset: {}", charset);
    }

    bytes = strip_bom(bytes, charset);
    if (charset == utf8_charset && is_valid_utf8(bytes)) {
        return std::string{bytes};
    }

    return to_utf8(to_utf16(bytes, charset));
}

} // namespace urlscrub
