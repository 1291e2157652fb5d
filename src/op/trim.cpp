/*
 * TPipe Trim Operators Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/op/trim.hpp>
#include <tpipe/util/text.hpp>
#include <algorithm>

namespace tpipe {

Trimmer::Trimmer(TrimPos pos, bool char_mode, const std::optional<std::string>& pattern, bool nocase)
    : m_pos(pos), m_char_mode(char_mode), m_nocase(nocase), m_blank(!pattern || pattern->empty()) {
    if (m_blank) return;
    m_pattern = nocase ? text::to_ascii_lower(*pattern) : *pattern;
    if (!m_char_mode) return;
    for (std::size_t i = 0; i < m_pattern.size();) {
        char32_t c = text::decode_next(m_pattern, i);
        if (std::find(m_set.begin(), m_set.end(), c) == m_set.end()) m_set.push_back(c);
    }
}

bool Trimmer::in_set(char32_t c) const {
    if (m_nocase) c = text::ascii_lower(c);
    return std::find(m_set.begin(), m_set.end(), c) != m_set.end();
}

std::string_view Trimmer::trim_start(std::string_view s) const {
    if (m_blank) return text::trim_ws_start(s);
    if (m_char_mode) {
        std::size_t i = 0;
        while (i < s.size()) {
            std::size_t next = i;
            if (!in_set(text::decode_next(s, next))) break;
            i = next;
        }
        return s.substr(i);
    }
    // one occurrence per end
    if (m_nocase ? text::starts_with_folded(s, m_pattern) : s.substr(0, m_pattern.size()) == m_pattern)
        s.remove_prefix(m_pattern.size());
    return s;
}

std::string_view Trimmer::trim_end(std::string_view s) const {
    if (m_blank) return text::trim_ws_end(s);
    if (m_char_mode) {
        std::size_t end = s.size();
        while (end > 0) {
            std::size_t start = text::prev_boundary(s, end), tmp = start;
            if (!in_set(text::decode_next(s, tmp))) break;
            end = start;
        }
        return s.substr(0, end);
    }
    auto ends_with = [&](std::string_view v) {
        return v.size() >= m_pattern.size() && v.substr(v.size() - m_pattern.size()) == m_pattern;
    };
    if (m_nocase ? text::ends_with_folded(s, m_pattern) : ends_with(s))
        s.remove_suffix(m_pattern.size());
    return s;
}

std::string_view Trimmer::apply(std::string_view s) const {
    switch (m_pos) {
        case TrimPos::Start: return trim_start(s);
        case TrimPos::End: return trim_end(s);
        default: return trim_end(trim_start(s));
    }
}

} // namespace tpipe
