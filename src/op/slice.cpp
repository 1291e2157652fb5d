/*
 * TPipe Multi-Range Slice Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/op/slice.hpp>
#include <algorithm>

namespace tpipe {

SlicePipe::SlicePipe(PipePtr source, const std::vector<Bounds<std::size_t>>& ranges) : m_source(std::move(source)) {
    for (const auto& r : ranges) {
        if (r.min && r.max && *r.min > *r.max) continue;
        m_ranges.push_back(r);
    }
}

std::optional<Item> SlicePipe::next() {
    while (true) {
        std::size_t idx = m_index;
        m_ranges.erase(std::remove_if(m_ranges.begin(), m_ranges.end(),
                                      [idx](const Bounds<std::size_t>& r) { return r.max && *r.max < idx; }),
                       m_ranges.end());
        if (m_ranges.empty()) return std::nullopt;
        auto item = m_source->next();
        if (!item) return std::nullopt;
        ++m_index;
        bool hit = std::any_of(m_ranges.begin(), m_ranges.end(),
                               [idx](const Bounds<std::size_t>& r) { return !r.min || *r.min <= idx; });
        if (hit) return item;
    }
}

} // namespace tpipe
