/*
 * TPipe Value Formatting
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Renders :gen values through a {fmt} template. The value is exposed as the
 *   named argument `v` (also reachable as the first positional `{}`), so
 *   "{v:>4}", "{v:#x}" and "n={}" are all valid templates.
 */
#pragma once
#include <string>
#include "tpipe/pipe/item.hpp"

namespace tpipe {

// Throws Error(FormatString) when the template is rejected.
std::string format_value(const std::string& tmpl, Integer value);

// Checks a template once at parse time by rendering a sample value.
void validate_format(const std::string& tmpl);

} // namespace tpipe
