/*
 * TPipe Driver Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/driver.hpp>
#include <tpipe/lex/lexer.hpp>
#include <tpipe/parse/parser.hpp>
#include <tpipe/pipe/source.hpp>
#include <tpipe/op/ops.hpp>
#include <tpipe/io/sink.hpp>
#include <fmt/format.h>
#include <limits>

namespace tpipe {

PipelineNode parse_pipeline_args(const std::vector<std::string>& args) { return parse_tokens(classify_args(args)); }

PipelineNode parse_pipeline_string(const std::string& token) { return parse_tokens(Lexer(token).run()); }

PipePtr build_pipeline(const PipelineNode& node, const Config& cfg, std::istream& in, std::ostream& out) {
    PipePtr pipe = make_source(node.input, cfg, in);
    for (const auto& op : node.ops) pipe = wrap_op(std::move(pipe), op, cfg, out);
    return pipe;
}

void run_pipeline(const PipelineNode& node, const Config& cfg, std::istream& in, std::ostream& out) {
    PipePtr pipe = build_pipeline(node, cfg, in, out);
    write_output(*pipe, node.output, out);
}

namespace {

std::string quoted_list(const std::vector<std::string>& v) {
    std::string s;
    for (const auto& x : v) s += (s.empty() ? "" : ", ") + fmt::format("\"{}\"", x);
    return "[" + s + "]";
}

std::string file_target(const FileTarget& t) {
    return fmt::format("\"{}\"{}{}", t.path, t.append ? " append" : "", t.ending == LineEnding::Crlf ? " crlf" : "");
}

std::string bound(const std::optional<std::size_t>& v) { return v ? std::to_string(*v) : ""; }

struct InputDescriber {
    std::string operator()(const StdInInput&) const { return "stdin"; }
    std::string operator()(const FileInput& f) const { return "file " + quoted_list(f.files); }
    std::string operator()(const ClipInput&) const { return "clipboard"; }
    std::string operator()(const OfInput& o) const { return "of " + quoted_list(o.values); }
    std::string operator()(const GenInput& g) const {
        std::string end = g.range.end == std::numeric_limits<Integer>::max() && !g.range.included ? "" : std::to_string(g.range.end);
        std::string s = fmt::format("gen {}..{}{} step {}", g.range.start, g.range.included ? "=" : "", end, g.range.step);
        if (g.fmt) s += fmt::format(" format \"{}\"", *g.fmt);
        return s;
    }
    std::string operator()(const RepeatInput& r) const {
        return fmt::format("repeat \"{}\" {}", r.value, r.count ? std::to_string(*r.count) + " times" : "forever");
    }
};

struct OpDescriber {
    std::string operator()(const PeekOp& p) const { return p.file ? "peek to " + file_target(*p.file) : "peek to stdout"; }
    std::string operator()(const CaseOp& c) const {
        switch (c.mode) {
            case CaseMode::Upper: return "upper";
            case CaseMode::Lower: return "lower";
            default: return "switch case";
        }
    }
    std::string operator()(const ReplaceOp& r) const {
        return fmt::format("replace \"{}\" with \"{}\"{}{}", r.from, r.to,
                           r.count ? " " + std::to_string(*r.count) + " times" : "", r.nocase ? " nocase" : "");
    }
    std::string operator()(const TrimOp& t) const {
        const char* pos = t.pos == TrimPos::Start ? "ltrim" : (t.pos == TrimPos::End ? "rtrim" : "trim");
        std::string what = t.pattern ? fmt::format("{} \"{}\"", t.char_mode ? "chars" : "text", *t.pattern) : "whitespace";
        return fmt::format("{} {}{}", pos, what, t.nocase ? " nocase" : "");
    }
    std::string operator()(const UniqOp& u) const { return u.nocase ? "uniq nocase" : "uniq"; }
    std::string operator()(const JoinOp& j) const {
        std::string s = fmt::format("join delim \"{}\" prefix \"{}\" postfix \"{}\"", j.delim, j.prefix, j.postfix);
        if (j.batch) s += " batch " + std::to_string(*j.batch);
        return s;
    }
    std::string operator()(const SliceOp& s) const {
        std::string r;
        for (const auto& b : s.ranges) r += (r.empty() ? "" : " ") + bound(b.min) + "," + bound(b.max);
        return "slice [" + r + "]";
    }
    std::string operator()(const TakeDropOp& t) const {
        const char* mode = "take";
        switch (t.mode) {
            case TakeDropMode::Drop: mode = "drop"; break;
            case TakeDropMode::TakeWhile: mode = "take while"; break;
            case TakeDropMode::DropWhile: mode = "drop while"; break;
            default: break;
        }
        return std::string(mode) + " " + t.cond.describe();
    }
    std::string operator()(const CountOp&) const { return "count"; }
    std::string operator()(const SortOp& s) const {
        if (s.by == SortBy::Random) return "sort random";
        std::string r = "sort";
        if (s.by == SortBy::Num) {
            r += " num";
            if (s.int_default) r += " default " + std::to_string(*s.int_default);
            else if (s.float_default) r += fmt::format(" default {}", *s.float_default);
        }
        if (s.nocase) r += " nocase";
        if (s.desc) r += " desc";
        return r;
    }
};

struct OutputDescriber {
    std::string operator()(const StdOutOutput&) const { return "stdout"; }
    std::string operator()(const FileOutput& f) const { return "file " + file_target(f.target); }
    std::string operator()(const ClipOutput& c) const { return c.ending == LineEnding::Crlf ? "clipboard crlf" : "clipboard"; }
};

} // namespace

std::string describe_pipeline(const PipelineNode& node) {
    std::string s = "input:  " + std::visit(InputDescriber{}, node.input) + "\n";
    for (std::size_t i = 0; i < node.ops.size(); ++i)
        s += fmt::format("op {:>2}: {}\n", i + 1, std::visit(OpDescriber{}, node.ops[i]));
    s += "output: " + std::visit(OutputDescriber{}, node.output);
    return s;
}

} // namespace tpipe
