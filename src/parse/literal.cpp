/*
 * TPipe Literal Parsing Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/parse/literal.hpp>
#include <fmt/format.h>
#include <charconv>
#include <cmath>
#include <cctype>

namespace tpipe {

static bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

std::optional<Integer> parse_integer(std::string_view s) {
    if (!s.empty() && s[0] == '+') s.remove_prefix(1);
    if (s.empty() || !all_digits(s[0] == '-' ? s.substr(1) : s)) return std::nullopt;
    Integer v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

std::optional<Float> parse_float(std::string_view s) {
    if (!s.empty() && s[0] == '+') s.remove_prefix(1);
    if (s.empty() || s[0] == '+') return std::nullopt;
    Float v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

std::optional<Num> parse_num(std::string_view s) {
    if (auto i = parse_integer(s)) return Num{*i};
    if (auto f = parse_float(s)) return Num{*f};
    return std::nullopt;
}

std::optional<std::size_t> parse_count(std::string_view s) {
    if (!all_digits(s)) return std::nullopt;
    std::size_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

static Float widen(const Num& n) {
    if (auto i = std::get_if<Integer>(&n)) return static_cast<Float>(*i);
    return std::get<Float>(n);
}

int compare_num(const Num& a, const Num& b) {
    auto ai = std::get_if<Integer>(&a); auto bi = std::get_if<Integer>(&b);
    if (ai && bi) return (*ai < *bi) ? -1 : (*ai > *bi ? 1 : 0);
    Float x = widen(a), y = widen(b);
    return (x < y) ? -1 : (x > y ? 1 : 0);
}

std::string num_to_string(const Num& n) {
    if (auto i = std::get_if<Integer>(&n)) return std::to_string(*i);
    return fmt::format("{}", std::get<Float>(n));
}

std::optional<GenRange> parse_gen_range(std::string_view s) {
    GenRange r;
    auto comma = s.find(',');
    auto start = parse_integer(s.substr(0, comma));
    if (!start) return std::nullopt;
    r.start = *start;
    if (comma == std::string_view::npos) return r;
    std::string_view rest = s.substr(comma + 1);
    if (!rest.empty() && rest[0] == '=') { r.included = true; rest.remove_prefix(1); }
    auto comma2 = rest.find(',');
    std::string_view end = rest.substr(0, comma2);
    if (!end.empty()) {
        auto e = parse_integer(end);
        if (!e) return std::nullopt;
        r.end = *e;
    }
    if (comma2 == std::string_view::npos) return r;
    auto step = parse_integer(rest.substr(comma2 + 1));
    if (!step || *step == 0) return std::nullopt;
    r.step = *step;
    return r;
}

std::optional<Bounds<std::size_t>> parse_slice_range(std::string_view s) {
    if (s.find(',') == std::string_view::npos) {
        auto n = parse_count(s);
        if (!n) return std::nullopt;
        return Bounds<std::size_t>{n, n};
    }
    return parse_bounds<std::size_t>(s, parse_count);
}

} // namespace tpipe
