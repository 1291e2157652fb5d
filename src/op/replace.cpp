/*
 * TPipe Replace Operator Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/op/replace.hpp>
#include <tpipe/util/text.hpp>
#include <limits>

namespace tpipe {

Replacer::Replacer(std::string from, std::string to, std::optional<std::size_t> count, bool nocase)
    : m_from(nocase ? text::to_ascii_lower(from) : std::move(from)), m_to(std::move(to)), m_count(count), m_nocase(nocase) {}

bool Replacer::match_at(std::string_view s, std::size_t i) const {
    if (m_nocase) return text::starts_with_folded(s.substr(i), m_from);
    return s.compare(i, m_from.size(), m_from) == 0;
}

std::string Replacer::apply_empty(std::string_view s) const {
    std::size_t left = m_count.value_or(std::numeric_limits<std::size_t>::max());
    std::string out; out.reserve(s.size() + m_to.size() * 2);
    std::size_t i = 0;
    while (true) {
        if (left > 0) { out += m_to; --left; }
        if (i >= s.size()) break;
        std::size_t next = i;
        text::decode_next(s, next);
        out.append(s.substr(i, next - i));
        i = next;
    }
    return out;
}

std::string Replacer::apply(std::string_view s) const {
    if (m_from.empty()) return apply_empty(s);
    std::size_t left = m_count.value_or(std::numeric_limits<std::size_t>::max());
    std::string out; out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size()) {
        if (left > 0 && i + m_from.size() <= s.size() && match_at(s, i)) {
            out += m_to; i += m_from.size(); --left;
            continue;
        }
        out.push_back(s[i++]);
    }
    return out;
}

} // namespace tpipe
