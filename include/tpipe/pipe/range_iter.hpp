/*
 * TPipe Range Generator
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Double-ended iterator over start, start+|step|, ... up to end (inclusive
 *   or exclusive). Both ends walk the same grid, so reading from the back
 *   yields exactly the forward elements in reverse order. A zero step over a
 *   non-empty range repeats start forever.
 */
#pragma once
#include <cstdint>
#include <optional>
#include "tpipe/pipe/item.hpp"

namespace tpipe {

class RangeIter {
public:
    RangeIter(Integer start, Integer end, bool included, Integer step);
    std::optional<Integer> next();
    std::optional<Integer> next_back();
private:
    Integer m_front = 0;
    Integer m_back = 0;
    std::uint64_t m_stride = 0;
    bool m_done = true;
    bool m_repeat = false;
};

} // namespace tpipe
