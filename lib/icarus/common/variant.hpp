/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_COMMON_VARIANT_HPP
#define ICARUS_COMMON_VARIANT_HPP

#include <source_location>
#include <typeinfo>
#include <variant>
#include <icarus/common/error.hpp>
#include <icarus/common/format.hpp>

namespace icarus::variant {
    template<typename TO, typename FROM>
    TO &get_nice(FROM &v, const std::source_location &loc=std::source_location::current())
    {
        return std::visit([&](auto &vo) -> TO & {
            using T = decltype(vo);
            if constexpr (std::is_same_v<std::decay_t<T>, std::decay_t<TO>>) {
                return vo;
            } else {
                throw error(fmt::format("expected type {} but got {} at {}", typeid(TO).name(), typeid(T).name(), loc));
            }
        }, v);
    }

    template<typename TO, typename FROM>
    const TO &get_nice(const FROM &v, const std::source_location &loc=std::source_location::current())
    {
        return std::visit([&](const auto &vo) -> const TO & {
            using T = decltype(vo);
            if constexpr (std::is_same_v<std::decay_t<T>, std::decay_t<TO>>) {
                return vo;
            } else {
                throw error(fmt::format("expected type {} but got {} at {}", typeid(TO).name(), typeid(T).name(), loc));
            }
        }, v);
    }
}

#endif // !ICARUS_COMMON_VARIANT_HPP
