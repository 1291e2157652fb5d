/*
 * TPipe Condition Engine
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Predicates used by :take and :drop. A Condition is a Select (what to
 *   test) plus a polarity bit. Every selector first resolves to a definite
 *   boolean; a numeric or length test against text that does not parse is
 *   false, never an error. `not` then inverts that boolean.
 */
#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include "tpipe/parse/literal.hpp"

namespace re2 { class RE2; }

namespace tpipe {

struct TextLenRange { Bounds<std::size_t> bounds; };
struct TextLenSpec { std::size_t len; };
struct NumRange { Bounds<Num> bounds; };
struct NumSpec { Num value; };

enum class NumberKind { Any, Integer, Float };
struct NumberClass { NumberKind kind = NumberKind::Any; };

struct TextCase { bool upper; };
struct TextAsciiness { bool ascii; };
struct TextEmptyOrBlank { bool empty; };

struct RegexMatch {
    std::string pattern;
    std::shared_ptr<const re2::RE2> re;
};

using Select = std::variant<TextLenRange, TextLenSpec, NumRange, NumSpec, NumberClass,
                            TextCase, TextAsciiness, TextEmptyOrBlank, RegexMatch>;

class Condition {
public:
    Condition(Select select, bool negate = false) : m_select(std::move(select)), m_negate(negate) {}
    bool test(std::string_view text) const;
    const Select& select() const { return m_select; }
    bool negated() const { return m_negate; }
    std::string describe() const;
private:
    Select m_select;
    bool m_negate;
};

// Compiles `pattern` (RE2 syntax) for whole-item matching. Inline flag
// groups such as (?i) (?m) (?s) or (?is) are honored. Matching runs in
// linear time with no recursion, so item length is unbounded.
// Throws Error(ParseRegex) when the pattern is invalid.
RegexMatch make_regex_match(const std::string& pattern);

} // namespace tpipe
