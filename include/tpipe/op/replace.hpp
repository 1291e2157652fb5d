/*
 * TPipe Replace Operator
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tpipe {

// Replaces up to `count` (default: all) non-overlapping occurrences of `from`,
// scanning left to right. An empty `from` matches at every character boundary.
class Replacer {
public:
    Replacer(std::string from, std::string to, std::optional<std::size_t> count, bool nocase);
    std::string apply(std::string_view s) const;
private:
    bool match_at(std::string_view s, std::size_t i) const;
    std::string apply_empty(std::string_view s) const;

    std::string m_from; // folded when nocase
    std::string m_to;
    std::optional<std::size_t> m_count;
    bool m_nocase;
};

} // namespace tpipe
