/*
 * TPipe Parser Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <tpipe/parse/ast.hpp>
#include <tpipe/parse/parser.hpp>
#include <tpipe/parse/tokens.hpp>
#include <tpipe/parse/literal.hpp>
#include <tpipe/fmt/format.hpp>
#include <tpipe/error.hpp>
#include <tpipe/util/text.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace tpipe {

class Parser {
public:
    Parser(const TokenStream& ts) : m_ts(ts) {}

    PipelineNode parse_pipeline() {
        PipelineNode p;
        if (auto in = parse_family(input_rules())) p.input = std::move(*in);
        while (auto op = parse_family(op_rules())) p.ops.push_back(std::move(*op));
        if (auto out = parse_family(output_rules())) p.output = std::move(*out);
        expect_end();
        return p;
    }

    Condition parse_lone_condition() {
        Condition c = parse_cond(":take");
        expect_end();
        return c;
    }

private:
    template <typename Node>
    using Rule = std::pair<const char*, Node (Parser::*)()>;

    const Token& peek() const { return m_ts[m_index]; }
    bool eof() const { return peek().kind == TokenKind::Eof; }
    const Token& get() { return m_ts[m_index++]; }

    bool at_word() const { return peek().kind == TokenKind::Word; }
    bool at_bracket(const char* b) const { return at_word() && !peek().quoted && peek().lexeme == b; }

    // Unquoted flag word such as `nocase` or `append`, matched case-insensitively.
    bool accept_flag(const char* kw) {
        if (!at_word() || peek().quoted || !text::iequals(peek().lexeme, kw)) return false;
        get(); return true;
    }

    std::optional<std::string> opt_word() {
        if (!at_word()) return std::nullopt;
        return get().lexeme;
    }

    std::string need_word(const std::string& cmd, const std::string& arg) {
        if (!at_word()) throw missing_arg(cmd, arg);
        return get().lexeme;
    }

    void expect_end() {
        if (eof()) return;
        if (peek().kind == TokenKind::Command)
            throw Error(ErrorCode::UnexpectedRemaining, "Unknown or misplaced command `" + peek().lexeme + "`");
        std::string rest;
        for (std::size_t i = m_index; m_ts[i].kind != TokenKind::Eof; ++i) rest += (rest.empty() ? "" : " ") + m_ts[i].lexeme;
        throw Error(ErrorCode::UnexpectedRemaining, "Unexpected remaining arguments: " + rest);
    }

    template <typename Node>
    std::optional<Node> parse_family(const std::vector<Rule<Node>>& rules) {
        if (peek().kind != TokenKind::Command) return std::nullopt;
        for (const auto& [kw, fn] : rules) {
            if (text::iequals(peek().lexeme, kw)) { get(); return (this->*fn)(); }
        }
        return std::nullopt;
    }

    // <value>+ : bare words up to the next command, or `[ a b c ]`.
    std::vector<std::string> parse_arglist(const std::string& cmd, const std::string& arg) {
        std::vector<std::string> out;
        if (at_bracket("[")) {
            get();
            while (!at_bracket("]")) {
                if (eof()) throw arg_parse_error(cmd, arg, "[", "missing closing `]`");
                out.push_back(get().lexeme);
            }
            get();
        } else {
            while (at_word() && !at_bracket("[") && !at_bracket("]")) out.push_back(get().lexeme);
        }
        if (out.empty()) throw missing_arg(cmd, arg);
        return out;
    }

    Integer int_arg(const std::string& cmd, const std::string& arg, const std::string& value, bool positive) {
        auto v = parse_integer(value);
        if (!v) throw Error(ErrorCode::ParseNum, "Invalid integer \"" + value + "\" in argument `" + arg + "` of cmd `" + cmd + "`");
        if (positive && *v <= 0)
            throw Error(ErrorCode::InvalidPositiveIntArg, "Argument `" + arg + "` of cmd `" + cmd + "` must be a positive integer, got " + value);
        if (!positive && *v < 0)
            throw Error(ErrorCode::InvalidNonNegativeIntArg, "Argument `" + arg + "` of cmd `" + cmd + "` must be a non-negative integer, got " + value);
        return *v;
    }

    // path[ append][ lf|crlf]
    FileTarget parse_file_info(std::string path) {
        FileTarget t; t.path = std::move(path);
        t.append = accept_flag("append");
        if (accept_flag("crlf")) t.ending = LineEnding::Crlf;
        else accept_flag("lf");
        return t;
    }

    // ---- input ----

    static const std::vector<Rule<InputNode>>& input_rules() {
        static const std::vector<Rule<InputNode>> rules = {
            {":in", &Parser::parse_stdin}, {":file", &Parser::parse_file}, {":clip", &Parser::parse_clip},
            {":of", &Parser::parse_of}, {":gen", &Parser::parse_gen}, {":repeat", &Parser::parse_repeat},
        };
        return rules;
    }

    InputNode parse_stdin() { return StdInInput{}; }
    InputNode parse_file() { return FileInput{parse_arglist(":file", "file_name")}; }
    InputNode parse_clip() { return ClipInput{}; }
    InputNode parse_of() { return OfInput{parse_arglist(":of", "value")}; }

    InputNode parse_gen() {
        std::string value = need_word(":gen", "range");
        auto range = parse_gen_range(value);
        if (!range) throw arg_parse_error(":gen", "range", value, "expected start[,[=][end][,step]] with a nonzero step");
        GenInput g{*range, opt_word()};
        if (g.fmt) validate_format(*g.fmt);
        return g;
    }

    InputNode parse_repeat() {
        RepeatInput r{need_word(":repeat", "value"), std::nullopt};
        if (at_word()) {
            if (auto n = parse_count(peek().lexeme)) { get(); r.count = n; }
        }
        return r;
    }

    // ---- operators ----

    static const std::vector<Rule<OpNode>>& op_rules() {
        static const std::vector<Rule<OpNode>> rules = {
            {":peek", &Parser::parse_peek},
            {":upper", &Parser::parse_upper}, {":lower", &Parser::parse_lower}, {":case", &Parser::parse_case},
            {":replace", &Parser::parse_replace},
            {":trim", &Parser::parse_trim}, {":ltrim", &Parser::parse_ltrim}, {":rtrim", &Parser::parse_rtrim},
            {":trimc", &Parser::parse_trimc}, {":ltrimc", &Parser::parse_ltrimc}, {":rtrimc", &Parser::parse_rtrimc},
            {":uniq", &Parser::parse_uniq}, {":join", &Parser::parse_join},
            {":limit", &Parser::parse_limit}, {":skip", &Parser::parse_skip}, {":slice", &Parser::parse_slice},
            {":take", &Parser::parse_take}, {":drop", &Parser::parse_drop},
            {":count", &Parser::parse_count_op}, {":sort", &Parser::parse_sort},
        };
        return rules;
    }

    OpNode parse_peek() {
        PeekOp p;
        if (auto path = opt_word()) p.file = parse_file_info(std::move(*path));
        return p;
    }

    OpNode parse_upper() { return CaseOp{CaseMode::Upper}; }
    OpNode parse_lower() { return CaseOp{CaseMode::Lower}; }
    OpNode parse_case() { return CaseOp{CaseMode::Switch}; }

    OpNode parse_replace() {
        ReplaceOp r;
        r.from = need_word(":replace", "from");
        r.to = need_word(":replace", "to");
        if (at_word() && parse_integer(peek().lexeme))
            r.count = static_cast<std::size_t>(int_arg(":replace", "count", get().lexeme, false));
        r.nocase = accept_flag("nocase");
        return r;
    }

    OpNode trim(TrimPos pos, bool char_mode) {
        TrimOp t{pos, char_mode, opt_word(), false};
        if (t.pattern) t.nocase = accept_flag("nocase");
        return t;
    }
    OpNode parse_trim() { return trim(TrimPos::Both, false); }
    OpNode parse_ltrim() { return trim(TrimPos::Start, false); }
    OpNode parse_rtrim() { return trim(TrimPos::End, false); }
    OpNode parse_trimc() { return trim(TrimPos::Both, true); }
    OpNode parse_ltrimc() { return trim(TrimPos::Start, true); }
    OpNode parse_rtrimc() { return trim(TrimPos::End, true); }

    OpNode parse_uniq() { return UniqOp{accept_flag("nocase")}; }

    OpNode parse_join() {
        JoinOp j;
        auto delim = opt_word(); if (!delim) return j;
        j.delim = std::move(*delim);
        auto prefix = opt_word(); if (!prefix) return j;
        j.prefix = std::move(*prefix);
        auto postfix = opt_word(); if (!postfix) return j;
        j.postfix = std::move(*postfix);
        if (auto batch = opt_word()) j.batch = static_cast<std::size_t>(int_arg(":join", "batch", *batch, true));
        return j;
    }

    OpNode parse_limit() {
        auto n = int_arg(":limit", "count", need_word(":limit", "count"), false);
        SliceOp s;
        if (n > 0) s.ranges.push_back({std::nullopt, static_cast<std::size_t>(n - 1)});
        return s;
    }

    OpNode parse_skip() {
        auto n = int_arg(":skip", "count", need_word(":skip", "count"), false);
        SliceOp s;
        s.ranges.push_back({static_cast<std::size_t>(n), std::nullopt});
        return s;
    }

    OpNode parse_slice() {
        SliceOp s;
        for (const auto& v : parse_arglist(":slice", "range")) {
            auto r = parse_slice_range(v);
            if (!r) throw arg_parse_error(":slice", "range", v, "expected [min],[max] or a single index");
            s.ranges.push_back(*r);
        }
        return s;
    }

    OpNode parse_take() {
        bool w = accept_flag("while");
        return TakeDropOp{w ? TakeDropMode::TakeWhile : TakeDropMode::Take, parse_cond(":take")};
    }

    OpNode parse_drop() {
        bool w = accept_flag("while");
        return TakeDropOp{w ? TakeDropMode::DropWhile : TakeDropMode::Drop, parse_cond(":drop")};
    }

    OpNode parse_count_op() { return CountOp{}; }

    // :sort random | :sort[ num[ <default>]][ nocase][ desc]
    OpNode parse_sort() {
        SortOp s;
        if (accept_flag("random")) { s.by = SortBy::Random; return s; }
        if (accept_flag("num")) {
            s.by = SortBy::Num;
            if (at_word()) {
                if (auto i = parse_integer(peek().lexeme)) { get(); s.int_default = i; }
                else if (auto f = parse_float(peek().lexeme)) { get(); s.float_default = f; }
            }
        }
        s.nocase = accept_flag("nocase");
        s.desc = accept_flag("desc");
        return s;
    }

    // ---- output ----

    static const std::vector<Rule<OutputNode>>& output_rules() {
        static const std::vector<Rule<OutputNode>> rules = { {":to", &Parser::parse_to} };
        return rules;
    }

    OutputNode parse_to() {
        std::string target = need_word(":to", "target");
        if (text::iequals(target, "out")) return StdOutOutput{};
        if (text::iequals(target, "file")) return FileOutput{parse_file_info(need_word(":to file", "file_name"))};
        if (text::iequals(target, "clip")) {
            ClipOutput c;
            if (accept_flag("crlf")) c.ending = LineEnding::Crlf;
            else accept_flag("lf");
            return c;
        }
        throw arg_parse_error(":to", "target", target, "expected out, file or clip");
    }

    // ---- conditions ----

    Condition parse_cond(const std::string& cmd) {
        bool negate = accept_flag("not");
        std::string sel = need_word(cmd, "condition");
        if (text::iequals(sel, "len")) return Condition(parse_len(cmd), negate);
        if (text::iequals(sel, "num")) return Condition(parse_num_select(cmd), negate);
        if (text::iequals(sel, "upper")) return Condition(TextCase{true}, negate);
        if (text::iequals(sel, "lower")) return Condition(TextCase{false}, negate);
        if (text::iequals(sel, "ascii")) return Condition(TextAsciiness{true}, negate);
        if (text::iequals(sel, "nonascii")) return Condition(TextAsciiness{false}, negate);
        if (text::iequals(sel, "empty")) return Condition(TextEmptyOrBlank{true}, negate);
        if (text::iequals(sel, "blank")) return Condition(TextEmptyOrBlank{false}, negate);
        if (text::iequals(sel, "reg")) return Condition(make_regex_match(need_word(cmd, "pattern")), negate);
        throw arg_parse_error(cmd, "condition", sel, "unknown condition");
    }

    Select parse_len(const std::string& cmd) {
        std::string v = need_word(cmd, "len");
        std::string_view sv = v;
        bool spec = !sv.empty() && sv[0] == '=';
        if (spec) sv.remove_prefix(1);
        if (!spec && sv.find(',') != std::string_view::npos) {
            if (auto b = parse_bounds<std::size_t>(sv, parse_count)) return TextLenRange{*b};
        } else if (auto n = parse_count(sv)) {
            return TextLenSpec{*n};
        }
        throw arg_parse_error(cmd, "len", v, "expected <min>,<max>, <n> or =<n>");
    }

    Select parse_num_select(const std::string& cmd) {
        if (!at_word() || peek().quoted) return NumberClass{NumberKind::Any};
        const std::string& v = peek().lexeme;
        if (text::iequals(v, "integer")) { get(); return NumberClass{NumberKind::Integer}; }
        if (text::iequals(v, "float")) { get(); return NumberClass{NumberKind::Float}; }
        std::string_view sv = v;
        bool spec = !sv.empty() && sv[0] == '=';
        if (spec) sv.remove_prefix(1);
        if (!spec && sv.find(',') != std::string_view::npos) {
            auto b = parse_bounds<Num>(sv, parse_num);
            if (!b) throw arg_parse_error(cmd, "num", v, "expected <min>,<max>");
            get(); return NumRange{*b};
        }
        auto n = parse_num(sv);
        if (n) { get(); return NumSpec{*n}; }
        if (spec) throw arg_parse_error(cmd, "num", v, "expected =<number>");
        return NumberClass{NumberKind::Any}; // not ours, left for the next command
    }

    const TokenStream& m_ts;
    std::size_t m_index = 0;
};

// Exposed helpers
PipelineNode parse_tokens(const TokenStream& ts) {
    Parser p(ts);
    return p.parse_pipeline();
}

Condition parse_condition(const TokenStream& ts) {
    Parser p(ts);
    return p.parse_lone_condition();
}

} // namespace tpipe
