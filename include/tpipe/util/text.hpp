/*
 * TPipe Text Utilities
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   UTF-8 scalar value walking, Unicode whitespace classification and the
 *   ASCII case folding used by every `nocase` comparison.
 */
#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace tpipe::text {

// Decode the scalar value starting at s[i] and advance i past it.
// A malformed sequence decodes as U+FFFD and consumes a single byte.
char32_t decode_next(std::string_view s, std::size_t& i);

// Index of the first byte of the scalar value that ends right before `end`.
std::size_t prev_boundary(std::string_view s, std::size_t end);

// Number of scalar values (not bytes).
std::size_t char_count(std::string_view s);

// Unicode White_Space property.
bool is_whitespace(char32_t c);

// Unicode Lowercase / Uppercase properties. Titlecase letters are neither.
bool is_lowercase(char32_t c);
bool is_uppercase(char32_t c);

bool is_ascii(std::string_view s);

inline char ascii_lower(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }
inline char ascii_upper(char c) { return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; }
inline char32_t ascii_lower(char32_t c) { return (c >= U'A' && c <= U'Z') ? c - U'A' + U'a' : c; }

std::string to_ascii_lower(std::string_view s);
bool iequals(std::string_view a, std::string_view b);

// `lower` must already be ASCII-lowercased; `s` is folded while comparing.
bool starts_with_folded(std::string_view s, std::string_view lower);
bool ends_with_folded(std::string_view s, std::string_view lower);

// Strip Unicode whitespace.
std::string_view trim_ws(std::string_view s);
std::string_view trim_ws_start(std::string_view s);
std::string_view trim_ws_end(std::string_view s);

} // namespace tpipe::text
