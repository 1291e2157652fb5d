/*
 * TPipe Sinks
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ostream>
#include "tpipe/parse/ast.hpp"
#include "tpipe/pipe/pipe.hpp"

namespace tpipe {

// Pulls every item from `pipe` into the output; `out` backs :to out.
// An output file is opened before the first pull. Clipboard text is the
// items joined by the line ending (no trailing ending).
void write_output(Pipe& pipe, const OutputNode& output, std::ostream& out);

} // namespace tpipe
