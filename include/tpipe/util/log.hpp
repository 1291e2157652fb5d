/*
 * TPipe Diagnostics
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Writes diagnostics to stderr. Errors are red, warnings yellow and info
 *   cyan when stderr is a terminal and color is enabled.
 */
#pragma once
#include <string>

namespace tpipe {

void set_log_color(bool enabled);
std::string apply_color(const std::string& s, const char* code);

void log_error(const std::string& msg);
void log_warn(const std::string& msg);
void log_info(const std::string& msg);

} // namespace tpipe
