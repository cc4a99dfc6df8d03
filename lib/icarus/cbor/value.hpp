/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CBOR_VALUE_HPP
#define ICARUS_CBOR_VALUE_HPP

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <icarus/big-int.hpp>
#include <icarus/common/bytes.hpp>
#include <icarus/common/format.hpp>
#include <icarus/common/variant.hpp>
#include <icarus/cbor/error.hpp>
#include <icarus/cbor/types.hpp>

namespace icarus::cbor {
    struct value;

    enum class simple: uint8_t {
        s_false = static_cast<uint8_t>(special_val::s_false),
        s_true = static_cast<uint8_t>(special_val::s_true),
        s_null = static_cast<uint8_t>(special_val::s_null),
        s_undefined = static_cast<uint8_t>(special_val::s_undefined),
        // the end-of-stream marker of indefinite-length items, never a part of a decoded value
        s_break = static_cast<uint8_t>(special_val::s_break)
    };

    using bytes = uint8_vector;

    struct array: std::vector<value> {
        using std::vector<value>::vector;
    };

    using map_item = std::pair<std::string, value>;

    // Keeps insertion order which is also the order in which the encoder emits the items.
    // Equality does not depend on the order.
    struct map: std::vector<map_item> {
        map() =default;
        map(std::initializer_list<map_item> items);

        // replaces the value of an existing key in place, otherwise appends
        value &set(std::string key, value val);
        const value *find(std::string_view key) const noexcept;
        const value &at(std::string_view key, const std::source_location &loc=std::source_location::current()) const;
        bool contains(std::string_view key) const noexcept;
        bool operator==(const map &o) const;
    };

    enum class value_type: uint8_t {
        integer,
        big_integer,
        text,
        bytes,
        array,
        map,
        simple
    };

    struct value {
        using content_type = std::variant<int64_t, cpp_int, std::string, cbor::bytes, cbor::array, cbor::map, cbor::simple>;

        static value from_uint(uint64_t magnitude);
        // builds -1 - magnitude
        static value from_nint(uint64_t magnitude);
        static value from_bigint(const cpp_int &v);

        value(): _content { simple::s_undefined }
        {
        }

        value(const bool b): _content { b ? simple::s_true : simple::s_false }
        {
        }

        value(const cbor::simple s): _content { s }
        {
        }

        template<std::integral T>
        requires (!std::same_as<T, bool>)
        value(const T v): value { _from_integral(v) }
        {
        }

        value(const cpp_int &v): value { from_bigint(v) }
        {
        }

        value(const char *s): _content { std::string { s } }
        {
        }

        value(const std::string_view s): _content { std::string { s } }
        {
        }

        value(std::string &&s): _content { std::move(s) }
        {
        }

        value(const std::string &s): _content { s }
        {
        }

        value(cbor::bytes &&b): _content { std::move(b) }
        {
        }

        value(const cbor::bytes &b): _content { b }
        {
        }

        value(cbor::array &&a): _content { std::move(a) }
        {
        }

        value(const cbor::array &a): _content { a }
        {
        }

        value(cbor::map &&m): _content { std::move(m) }
        {
        }

        value(const cbor::map &m): _content { m }
        {
        }

        value_type type() const noexcept
        {
            return static_cast<value_type>(_content.index());
        }

        bool valueless() const noexcept
        {
            return _content.valueless_by_exception();
        }

        bool is_integer() const noexcept
        {
            return type() == value_type::integer || type() == value_type::big_integer;
        }

        bool is_text() const noexcept
        {
            return type() == value_type::text;
        }

        bool is_bytes() const noexcept
        {
            return type() == value_type::bytes;
        }

        bool is_array() const noexcept
        {
            return type() == value_type::array;
        }

        bool is_map() const noexcept
        {
            return type() == value_type::map;
        }

        bool is_bool() const noexcept
        {
            if (const auto *s = std::get_if<cbor::simple>(&_content); s)
                return *s == simple::s_false || *s == simple::s_true;
            return false;
        }

        bool is_null() const noexcept
        {
            return _is_simple(simple::s_null);
        }

        bool is_undefined() const noexcept
        {
            return _is_simple(simple::s_undefined);
        }

        // the native arm; values outside of the safe-integer range are reported as an error
        int64_t integer(const std::source_location &loc=std::source_location::current()) const
        {
            return variant::get_nice<int64_t>(_content, loc);
        }

        // either integer arm as an arbitrary-precision integer
        cpp_int bigint(const std::source_location &loc=std::source_location::current()) const;

        bool boolean(const std::source_location &loc=std::source_location::current()) const;

        const std::string &text(const std::source_location &loc=std::source_location::current()) const
        {
            return variant::get_nice<std::string>(_content, loc);
        }

        const cbor::bytes &buf(const std::source_location &loc=std::source_location::current()) const
        {
            return variant::get_nice<cbor::bytes>(_content, loc);
        }

        const cbor::array &array(const std::source_location &loc=std::source_location::current()) const
        {
            return variant::get_nice<cbor::array>(_content, loc);
        }

        const cbor::map &map(const std::source_location &loc=std::source_location::current()) const
        {
            return variant::get_nice<cbor::map>(_content, loc);
        }

        cbor::simple simple_val(const std::source_location &loc=std::source_location::current()) const
        {
            return variant::get_nice<cbor::simple>(_content, loc);
        }

        const value &at(const size_t idx, const std::source_location &loc=std::source_location::current()) const;
        const value &at(std::string_view key, const std::source_location &loc=std::source_location::current()) const;

        const content_type &content() const noexcept
        {
            return _content;
        }

        bool operator==(const value &o) const;
    private:
        content_type _content;

        explicit value(content_type &&c): _content { std::move(c) }
        {
        }

        template<std::integral T>
        static value _from_integral(const T v)
        {
            if constexpr (std::is_signed_v<T>) {
                if (is_safe_integer(static_cast<int64_t>(v)))
                    return value { content_type { std::in_place_type<int64_t>, static_cast<int64_t>(v) } };
                return value { content_type { std::in_place_type<cpp_int>, static_cast<int64_t>(v) } };
            } else {
                return from_uint(static_cast<uint64_t>(v));
            }
        }

        bool _is_simple(const cbor::simple s) const noexcept
        {
            if (const auto *sv = std::get_if<cbor::simple>(&_content); sv)
                return *sv == s;
            return false;
        }
    };

    extern std::string stringify(const value &v);
}

namespace fmt {
    template<>
    struct formatter<icarus::cbor::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", icarus::cbor::stringify(v));
        }
    };

    template<>
    struct formatter<icarus::cbor::simple>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using icarus::cbor::simple;
            switch (v) {
                case simple::s_false: return fmt::format_to(ctx.out(), "false");
                case simple::s_true: return fmt::format_to(ctx.out(), "true");
                case simple::s_null: return fmt::format_to(ctx.out(), "null");
                case simple::s_undefined: return fmt::format_to(ctx.out(), "undefined");
                case simple::s_break: return fmt::format_to(ctx.out(), "break");
                default: return fmt::format_to(ctx.out(), "simple({})", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<icarus::cbor::value_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using icarus::cbor::value_type;
            switch (v) {
                case value_type::integer: return fmt::format_to(ctx.out(), "cbor::integer");
                case value_type::big_integer: return fmt::format_to(ctx.out(), "cbor::big_integer");
                case value_type::text: return fmt::format_to(ctx.out(), "cbor::text");
                case value_type::bytes: return fmt::format_to(ctx.out(), "cbor::bytes");
                case value_type::array: return fmt::format_to(ctx.out(), "cbor::array");
                case value_type::map: return fmt::format_to(ctx.out(), "cbor::map");
                case value_type::simple: return fmt::format_to(ctx.out(), "cbor::simple");
                default: return fmt::format_to(ctx.out(), "unsupported value type {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !ICARUS_CBOR_VALUE_HPP
