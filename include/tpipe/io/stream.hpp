/*
 * TPipe Line I/O
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <fstream>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "tpipe/parse/ast.hpp"

namespace tpipe {

const char* line_ending(LineEnding e);

// std::getline with a trailing '\r' removed.
bool read_line(std::istream& in, std::string& line);

// Split clipboard text into lines; a final line ending does not start an empty line.
std::vector<std::string> split_lines(const std::string& text);

// Creates or truncates (or appends to) the target. Throws Error(OpenFile).
std::unique_ptr<std::ofstream> open_output_file(const FileTarget& target);

// Throws Error(WriteToFile) naming `name` when the stream fails.
void write_line(std::ostream& out, const std::string& text, LineEnding e, const std::string& name);

} // namespace tpipe
