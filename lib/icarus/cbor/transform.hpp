/* This file is part of Icarus CBOR project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CBOR_TRANSFORM_HPP
#define ICARUS_CBOR_TRANSFORM_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <icarus/cbor/value.hpp>

namespace icarus::cbor {
    // The key is the map key or the decimal index of an array item, and std::nullopt for the root item.
    using transform_key = std::optional<std::string_view>;
    // applied on decode to every item after its children, the root last; takes ownership of the item
    using reviver = std::function<value(value, transform_key)>;
    // applied on encode to every item before its children, the root first; the item stays owned by the caller
    using replacer = std::function<value(const value &, transform_key)>;

    inline value apply_transform(const reviver &t, value &&v, const transform_key key)
    {
        if (!t)
            return std::move(v);
        return t(std::move(v), key);
    }

    inline std::string index_key(const size_t idx)
    {
        return fmt::format("{}", idx);
    }
}

#endif // !ICARUS_CBOR_TRANSFORM_HPP
