// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2022 Datadog, Inc.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace urlscrub {

enum class text_encoding : uint8_t { automatic, utf8, utf16le, utf16be, latin1 };

std::optional<text_encoding> encoding_from_string(std::string_view str);
std::string_view encoding_to_string(text_encoding encoding);

// ICU converter name of an explicit encoding, automatic has none
std::optional<std::string_view> encoding_charset(text_encoding encoding);

bool is_valid_utf8(std::string_view bytes);

// Guesses the charset of a buffer and returns its ICU converter name. A byte
// order mark takes precedence, then valid UTF-8 is recognised as such and
// anything else is handed to the ICU charset detector. When the detector has
// no confident answer the buffer is assumed to be ISO-8859-1.
std::string detect_charset(std::string_view bytes);

// Converts the buffer to UTF-8 with ICU, removing any byte order mark.
// Sequences which can't be decoded are replaced by U+FFFD. Throws
// std::runtime_error if ICU fails to open a converter or to convert.
std::string decode_to_utf8(std::string_view bytes, text_encoding encoding);

} // namespace urlscrub
