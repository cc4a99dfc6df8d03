/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_BIG_INT_HPP
#define ICARUS_BIG_INT_HPP

#include <cstdint>
#include <limits>
#include <sstream>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <icarus/common/format.hpp>

namespace icarus {
    using boost::multiprecision::cpp_int;

    // the largest magnitude a double-precision number represents exactly: 2^53 - 1
    static constexpr int64_t max_safe_integer = (int64_t { 1 } << 53) - 1;

    inline const cpp_int &big_uint64_max()
    {
        static const cpp_int max_val { std::numeric_limits<uint64_t>::max() };
        return max_val;
    }

    inline bool is_safe_integer(const cpp_int &v)
    {
        return v >= -max_safe_integer && v <= max_safe_integer;
    }

    inline bool is_safe_integer(const int64_t v) noexcept
    {
        return v >= -max_safe_integer && v <= max_safe_integer;
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !ICARUS_BIG_INT_HPP
