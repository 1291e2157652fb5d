/*
 * TPipe Pipeline Description
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Defines the validated description of a pipeline produced by the parser:
 *   one input node, an ordered list of operator nodes and one output node.
 *   Each family is a closed std::variant of argument structs; the driver
 *   turns every alternative into one concrete pull stage. Nodes are built
 *   once at startup and only read during execution.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include "tpipe/cond/condition.hpp"
#include "tpipe/parse/literal.hpp"

namespace tpipe {

enum class LineEnding { Lf, Crlf };

struct FileTarget {
    std::string path;
    bool append = false;
    LineEnding ending = LineEnding::Lf;
};

// ---- input ----

struct StdInInput {};
struct FileInput { std::vector<std::string> files; };
struct ClipInput {};
struct OfInput { std::vector<std::string> values; };
struct GenInput {
    GenRange range;
    std::optional<std::string> fmt; // with a template the items are text
};
struct RepeatInput {
    std::string value;
    std::optional<std::size_t> count; // absent: infinite
};

using InputNode = std::variant<StdInInput, FileInput, ClipInput, OfInput, GenInput, RepeatInput>;

// ---- operators ----

struct PeekOp { std::optional<FileTarget> file; }; // absent: stdout

enum class CaseMode { Upper, Lower, Switch };
struct CaseOp { CaseMode mode; };

struct ReplaceOp {
    std::string from;
    std::string to;
    std::optional<std::size_t> count; // absent: all
    bool nocase = false;
};

enum class TrimPos { Both, Start, End };
struct TrimOp {
    TrimPos pos = TrimPos::Both;
    bool char_mode = false;          // :trimc family
    std::optional<std::string> pattern; // absent: Unicode whitespace
    bool nocase = false;
};

struct UniqOp { bool nocase = false; };

struct JoinOp {
    std::string delim;
    std::string prefix;
    std::string postfix;
    std::optional<std::size_t> batch;
};

// :slice, :limit and :skip
struct SliceOp { std::vector<Bounds<std::size_t>> ranges; };

enum class TakeDropMode { Take, Drop, TakeWhile, DropWhile };
struct TakeDropOp {
    TakeDropMode mode;
    Condition cond;
};

struct CountOp {};

enum class SortBy { Text, Num, Random };
struct SortOp {
    SortBy by = SortBy::Text;
    std::optional<Integer> int_default;
    std::optional<Float> float_default;
    bool nocase = false;
    bool desc = false;
};

using OpNode = std::variant<PeekOp, CaseOp, ReplaceOp, TrimOp, UniqOp, JoinOp, SliceOp,
                            TakeDropOp, CountOp, SortOp>;

// ---- output ----

struct StdOutOutput {};
struct FileOutput { FileTarget target; };
struct ClipOutput { LineEnding ending = LineEnding::Lf; };

using OutputNode = std::variant<StdOutOutput, FileOutput, ClipOutput>;

struct PipelineNode {
    InputNode input = StdInInput{};
    std::vector<OpNode> ops;
    OutputNode output = StdOutOutput{};
};

} // namespace tpipe
