/*
 * TPipe Value Formatting Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/fmt/format.hpp>
#include <tpipe/error.hpp>
#include <fmt/format.h>

namespace tpipe {

std::string format_value(const std::string& tmpl, Integer value) {
    try {
        return fmt::format(fmt::runtime(tmpl), fmt::arg("v", value));
    } catch (const fmt::format_error& e) {
        throw Error(ErrorCode::FormatString, "Invalid format string \"" + tmpl + "\": " + e.what());
    }
}

void validate_format(const std::string& tmpl) { (void)format_value(tmpl, 0); }

} // namespace tpipe
