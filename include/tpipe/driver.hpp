/*
 * TPipe Driver
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Glue between the command line and the engine: tokens come either from
 *   argv words or from one --eval string, are parsed into a PipelineNode,
 *   then realized as source -> stages -> sink and run to completion.
 */
#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include "tpipe/config.hpp"
#include "tpipe/parse/ast.hpp"
#include "tpipe/pipe/pipe.hpp"

namespace tpipe {

PipelineNode parse_pipeline_args(const std::vector<std::string>& args);
PipelineNode parse_pipeline_string(const std::string& token);

// Source plus every stage; :peek files are opened here.
PipePtr build_pipeline(const PipelineNode& node, const Config& cfg, std::istream& in, std::ostream& out);

// `in` backs :in, `out` backs :to out and :peek without a file.
void run_pipeline(const PipelineNode& node, const Config& cfg, std::istream& in, std::ostream& out);

// One line per part: input, each operator, output.
std::string describe_pipeline(const PipelineNode& node);

} // namespace tpipe
