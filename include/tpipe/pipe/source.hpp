/*
 * TPipe Sources
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Turns an InputNode into the first pull stage of a pipeline. Files and
 *   the clipboard are only touched on the first pull.
 */
#pragma once
#include <istream>
#include "tpipe/config.hpp"
#include "tpipe/parse/ast.hpp"
#include "tpipe/pipe/pipe.hpp"

namespace tpipe {

// `in` backs :in (normally std::cin).
PipePtr make_source(const InputNode& input, const Config& cfg, std::istream& in);

} // namespace tpipe
