/*
 * TPipe Condition Engine Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/cond/condition.hpp>
#include <tpipe/error.hpp>
#include <tpipe/util/text.hpp>
#include <re2/re2.h>

namespace tpipe {

namespace {

template <typename T, typename Cmp>
bool in_bounds(const Bounds<T>& b, const T& v, Cmp cmp) {
    if (b.min && cmp(v, *b.min) < 0) return false;
    if (b.max && cmp(v, *b.max) > 0) return false;
    return true;
}

int cmp_size(std::size_t a, std::size_t b) { return a < b ? -1 : (a > b ? 1 : 0); }

bool all_chars(std::string_view s, bool (*pred)(char32_t)) {
    for (std::size_t i = 0; i < s.size();) if (!pred(text::decode_next(s, i))) return false;
    return true;
}

struct Evaluator {
    std::string_view text;

    bool operator()(const TextLenRange& c) const { return in_bounds(c.bounds, text::char_count(text), cmp_size); }
    bool operator()(const TextLenSpec& c) const { return text::char_count(text) == c.len; }
    bool operator()(const NumRange& c) const {
        auto n = parse_num(text);
        return n && in_bounds(c.bounds, *n, compare_num);
    }
    bool operator()(const NumSpec& c) const {
        auto n = parse_num(text);
        return n && compare_num(*n, c.value) == 0;
    }
    bool operator()(const NumberClass& c) const {
        switch (c.kind) {
            case NumberKind::Integer: return parse_integer(text).has_value();
            case NumberKind::Float: return !parse_integer(text) && parse_float(text).has_value();
            default: return parse_num(text).has_value();
        }
    }
    // Uncased characters (digits, punctuation, CJK) pass either test.
    bool operator()(const TextCase& c) const {
        if (c.upper) return all_chars(text, [](char32_t ch) { return !text::is_lowercase(ch); });
        return all_chars(text, [](char32_t ch) { return !text::is_uppercase(ch); });
    }
    bool operator()(const TextAsciiness& c) const {
        if (c.ascii) return text::is_ascii(text);
        return all_chars(text, [](char32_t ch) { return ch >= 0x80; });
    }
    bool operator()(const TextEmptyOrBlank& c) const {
        if (c.empty) return text.empty();
        return all_chars(text, text::is_whitespace);
    }
    bool operator()(const RegexMatch& c) const {
        return re2::RE2::FullMatch(re2::StringPiece(text.data(), text.size()), *c.re);
    }
};

template <typename T>
std::string opt_to_string(const std::optional<T>& v, std::string (*f)(const T&)) { return v ? f(*v) : ""; }

std::string size_to_string(const std::size_t& v) { return std::to_string(v); }

struct Describer {
    std::string operator()(const TextLenRange& c) const {
        return "len " + opt_to_string(c.bounds.min, size_to_string) + "," + opt_to_string(c.bounds.max, size_to_string);
    }
    std::string operator()(const TextLenSpec& c) const { return "len =" + std::to_string(c.len); }
    std::string operator()(const NumRange& c) const {
        return "num " + opt_to_string(c.bounds.min, num_to_string) + "," + opt_to_string(c.bounds.max, num_to_string);
    }
    std::string operator()(const NumSpec& c) const { return "num =" + num_to_string(c.value); }
    std::string operator()(const NumberClass& c) const {
        switch (c.kind) {
            case NumberKind::Integer: return "num integer";
            case NumberKind::Float: return "num float";
            default: return "num";
        }
    }
    std::string operator()(const TextCase& c) const { return c.upper ? "upper" : "lower"; }
    std::string operator()(const TextAsciiness& c) const { return c.ascii ? "ascii" : "nonascii"; }
    std::string operator()(const TextEmptyOrBlank& c) const { return c.empty ? "empty" : "blank"; }
    std::string operator()(const RegexMatch& c) const { return "reg " + c.pattern; }
};

} // namespace

bool Condition::test(std::string_view text) const {
    bool res = std::visit(Evaluator{text}, m_select);
    return m_negate ? !res : res;
}

std::string Condition::describe() const {
    std::string s = std::visit(Describer{}, m_select);
    return m_negate ? "not " + s : s;
}

RegexMatch make_regex_match(const std::string& pattern) {
    re2::RE2::Options opts;
    opts.set_log_errors(false);
    auto re = std::make_shared<const re2::RE2>(pattern, opts);
    if (!re->ok())
        throw Error(ErrorCode::ParseRegex, "Invalid regex `" + pattern + "`: " + re->error());
    return RegexMatch{pattern, std::move(re)};
}

} // namespace tpipe
