/*
 * TPipe Literal Parsing
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Numeric literals and the compact range spellings used by :gen, :slice
 *   and the len/num conditions. Every function returns std::nullopt when the
 *   whole input does not match; the grammar layer turns that into an Error
 *   naming the command and argument.
 */
#pragma once
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include "tpipe/pipe/item.hpp"

namespace tpipe {

using Num = std::variant<Integer, Float>;

// [+-]digits, within the range of Integer.
std::optional<Integer> parse_integer(std::string_view s);
// Finite decimal floating literal; NaN and infinities are rejected.
std::optional<Float> parse_float(std::string_view s);
// Integer grammar first, else a finite float.
std::optional<Num> parse_num(std::string_view s);
// Unsigned decimal digits only.
std::optional<std::size_t> parse_count(std::string_view s);

// <0, 0, >0. Mixed Integer/Float comparisons widen the integer.
int compare_num(const Num& a, const Num& b);
std::string num_to_string(const Num& n);

struct GenRange {
    Integer start = 0;
    Integer end = std::numeric_limits<Integer>::max();
    bool included = false;
    Integer step = 1;
};

// start[,[=][end][,step]] with a nonzero step.
std::optional<GenRange> parse_gen_range(std::string_view s);

template <typename T>
struct Bounds {
    std::optional<T> min;
    std::optional<T> max;
};

// "<min>,<max>" where either side may be empty but not both.
template <typename T, typename F>
std::optional<Bounds<T>> parse_bounds(std::string_view s, F parse_one) {
    auto comma = s.find(',');
    if (comma == std::string_view::npos) return std::nullopt;
    Bounds<T> b;
    std::string_view lo = s.substr(0, comma), hi = s.substr(comma + 1);
    if (!lo.empty()) { b.min = parse_one(lo); if (!b.min) return std::nullopt; }
    if (!hi.empty()) { b.max = parse_one(hi); if (!b.max) return std::nullopt; }
    if (!b.min && !b.max) return std::nullopt;
    return b;
}

// A slice range: "[min],[max]" (inclusive) or a single index "n" meaning n,n.
std::optional<Bounds<std::size_t>> parse_slice_range(std::string_view s);

} // namespace tpipe
