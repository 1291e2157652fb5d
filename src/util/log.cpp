/*
 * TPipe Diagnostics Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/util/log.hpp>
#include <iostream>
#include <unistd.h>

namespace tpipe {

static bool g_color = true;

void set_log_color(bool enabled) { g_color = enabled; }

std::string apply_color(const std::string& s, const char* code) {
    if (!g_color || !isatty(STDERR_FILENO)) return s;
    return std::string("\x1b[") + code + "m" + s + "\x1b[0m";
}

void log_error(const std::string& msg) { std::cerr << apply_color(msg, "1;31") << '\n'; }
void log_warn(const std::string& msg) { std::cerr << apply_color("warning: " + msg, "33") << '\n'; }
void log_info(const std::string& msg) { std::cerr << apply_color(msg, "36") << '\n'; }

} // namespace tpipe
