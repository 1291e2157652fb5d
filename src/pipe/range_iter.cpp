/*
 * TPipe Range Generator Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/pipe/range_iter.hpp>
#include <limits>

namespace tpipe {

// Grid arithmetic runs on uint64 so that ranges touching INT64_MIN/MAX never overflow.
static Integer advance(Integer v, std::uint64_t by) { return static_cast<Integer>(static_cast<std::uint64_t>(v) + by); }
static Integer retreat(Integer v, std::uint64_t by) { return static_cast<Integer>(static_cast<std::uint64_t>(v) - by); }

RangeIter::RangeIter(Integer start, Integer end, bool included, Integer step) {
    if (!included && end == std::numeric_limits<Integer>::min()) return;
    Integer last = included ? end : end - 1;
    if (start > last) return;
    m_done = false;
    m_front = start;
    if (step == 0) { m_repeat = true; m_back = start; return; }
    m_stride = step < 0 ? 0 - static_cast<std::uint64_t>(step) : static_cast<std::uint64_t>(step);
    std::uint64_t span = static_cast<std::uint64_t>(last) - static_cast<std::uint64_t>(start);
    m_back = advance(start, (span / m_stride) * m_stride);
}

std::optional<Integer> RangeIter::next() {
    if (m_done) return std::nullopt;
    Integer v = m_front;
    if (m_repeat) return v;
    if (m_front == m_back) m_done = true; else m_front = advance(m_front, m_stride);
    return v;
}

std::optional<Integer> RangeIter::next_back() {
    if (m_done) return std::nullopt;
    Integer v = m_back;
    if (m_repeat) return v;
    if (m_front == m_back) m_done = true; else m_back = retreat(m_back, m_stride);
    return v;
}

} // namespace tpipe
