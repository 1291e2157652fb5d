/*
 * TPipe Pull Stage Interface
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Sources and stages share one interface: the sink pulls items one at a
 *   time through the chain with next(). std::nullopt marks the end of the
 *   stream; I/O failures are thrown as tpipe::Error.
 */
#pragma once
#include <memory>
#include <optional>
#include "tpipe/pipe/item.hpp"

namespace tpipe {

class Pipe {
public:
    virtual ~Pipe() = default;
    virtual std::optional<Item> next() = 0;
};

using PipePtr = std::unique_ptr<Pipe>;

} // namespace tpipe
