/*
 * TPipe Pipeline Item
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstdint>
#include <string>
#include <variant>

namespace tpipe {

using Integer = std::int64_t;
using Float = double;

// A text line or a generated integer. Text stages see an Integer as its decimal text.
using Item = std::variant<std::string, Integer>;

inline std::string item_text(const Item& item) {
    if (auto s = std::get_if<std::string>(&item)) return *s;
    return std::to_string(std::get<Integer>(item));
}

inline std::string item_text(Item&& item) {
    if (auto s = std::get_if<std::string>(&item)) return std::move(*s);
    return std::to_string(std::get<Integer>(item));
}

} // namespace tpipe
