/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CBOR_TYPES_HPP
#define ICARUS_CBOR_TYPES_HPP

#include <cstdint>
#include <icarus/common/format.hpp>

namespace icarus::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    // the largest additional info value that encodes the argument directly in the header byte
    static constexpr uint8_t max_literal_info = 23;
    static constexpr uint8_t break_byte = 0xFF;
    // RFC 8949 section 3.4.6
    static constexpr uint64_t self_described_tag = 55799;

    constexpr uint8_t make_header_byte(const major_type typ, const uint8_t info) noexcept
    {
        return (static_cast<uint8_t>(typ) << 5) | (info & 0x1F);
    }
}

namespace fmt {
    template<>
    struct formatter<icarus::cbor::special_val>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using icarus::cbor::special_val;
            switch (v) {
                case special_val::s_false: return fmt::format_to(ctx.out(), "false");
                case special_val::s_true: return fmt::format_to(ctx.out(), "true");
                case special_val::s_null: return fmt::format_to(ctx.out(), "null");
                case special_val::s_undefined: return fmt::format_to(ctx.out(), "undefined");
                case special_val::one_byte: return fmt::format_to(ctx.out(), "one_byte");
                case special_val::two_bytes: return fmt::format_to(ctx.out(), "two_bytes");
                case special_val::four_bytes: return fmt::format_to(ctx.out(), "four_bytes");
                case special_val::eight_bytes: return fmt::format_to(ctx.out(), "eight_bytes");
                case special_val::s_break: return fmt::format_to(ctx.out(), "break");
                default: return fmt::format_to(ctx.out(), "special_value: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<icarus::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using icarus::cbor::major_type;
            switch (v) {
                case major_type::uint: return fmt::format_to(ctx.out(), "uint");
                case major_type::nint: return fmt::format_to(ctx.out(), "nint");
                case major_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case major_type::text: return fmt::format_to(ctx.out(), "text");
                case major_type::array: return fmt::format_to(ctx.out(), "array");
                case major_type::map: return fmt::format_to(ctx.out(), "map");
                case major_type::tag: return fmt::format_to(ctx.out(), "tag");
                case major_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "major_type: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !ICARUS_CBOR_TYPES_HPP
