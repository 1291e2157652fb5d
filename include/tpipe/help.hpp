/*
 * TPipe Help and Version
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ostream>
#include <string>

namespace tpipe {

// Empty topic prints every section. Returns false for an unknown topic
// (only the general section is printed then).
bool print_help(std::ostream& os, const std::string& topic);

void print_version(std::ostream& os);

} // namespace tpipe
