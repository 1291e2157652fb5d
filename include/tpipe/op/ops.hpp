/*
 * TPipe Operator Catalog
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Maps every OpNode alternative to one concrete pull stage:
 *     per-item map      :upper :lower :case :replace :trim*
 *     per-item filter   :uniq :take :drop
 *     per-item inspect  :peek
 *     whole stream      :sort :count :join (no batch)
 *     chunked           :join with a batch size
 *     index slicing     :slice :limit :skip
 *   A per-operator nocase switch is combined with Config::nocase.
 */
#pragma once
#include <ostream>
#include "tpipe/config.hpp"
#include "tpipe/parse/ast.hpp"
#include "tpipe/pipe/pipe.hpp"

namespace tpipe {

// `out` receives :peek output when no file is given. A :peek file is opened
// here, so Error(OpenFile) is raised before the first item is pulled.
PipePtr wrap_op(PipePtr source, const OpNode& op, const Config& cfg, std::ostream& out);

} // namespace tpipe
