/*
 * TPipe Multi-Range Slice
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Yields each upstream item at most once, in source order, when its index
 *   lies in the union of inclusive (min, max) ranges. Ranges whose max is
 *   behind the current index are retired; once none remain the stream ends
 *   without reading more input. Inverted ranges are dropped up front.
 */
#pragma once
#include <cstddef>
#include <vector>
#include "tpipe/parse/literal.hpp"
#include "tpipe/pipe/pipe.hpp"

namespace tpipe {

class SlicePipe : public Pipe {
public:
    SlicePipe(PipePtr source, const std::vector<Bounds<std::size_t>>& ranges);
    std::optional<Item> next() override;
private:
    PipePtr m_source;
    std::vector<Bounds<std::size_t>> m_ranges;
    std::size_t m_index = 0;
};

} // namespace tpipe
