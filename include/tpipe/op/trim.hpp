/*
 * TPipe Trim Operators
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   :trim/:ltrim/:rtrim strip one occurrence of a literal substring from
 *   each trimmed end; :trimc/:ltrimc/:rtrimc strip every boundary character
 *   found in a set. Without a pattern (or with an empty one) both strip
 *   Unicode whitespace. With nocase the pattern is ASCII-folded once here and the
 *   subject is folded per comparison.
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "tpipe/parse/ast.hpp"

namespace tpipe {

class Trimmer {
public:
    Trimmer(TrimPos pos, bool char_mode, const std::optional<std::string>& pattern, bool nocase);
    std::string_view apply(std::string_view s) const;
private:
    std::string_view trim_start(std::string_view s) const;
    std::string_view trim_end(std::string_view s) const;
    bool in_set(char32_t c) const;

    TrimPos m_pos;
    bool m_char_mode;
    bool m_nocase;
    bool m_blank;               // no or empty pattern: whitespace
    std::string m_pattern;      // folded when nocase
    std::vector<char32_t> m_set; // char mode, deduplicated
};

} // namespace tpipe
