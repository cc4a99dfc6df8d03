/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <iterator>
#include <typeinfo>
#include <icarus/cbor/value.hpp>

namespace icarus::cbor {
    map::map(std::initializer_list<map_item> items)
    {
        reserve(items.size());
        for (const auto &[k, v]: items)
            set(k, v);
    }

    value &map::set(std::string key, value val)
    {
        for (auto &[k, v]: *this) {
            if (k == key) {
                v = std::move(val);
                return v;
            }
        }
        return emplace_back(std::move(key), std::move(val)).second;
    }

    const value *map::find(const std::string_view key) const noexcept
    {
        for (const auto &[k, v]: *this) {
            if (k == key)
                return &v;
        }
        return nullptr;
    }

    const value &map::at(const std::string_view key, const std::source_location &loc) const
    {
        if (const auto *v = find(key); v)
            return *v;
        throw error(fmt::format("missing map key '{}' at {}", key, loc));
    }

    bool map::contains(const std::string_view key) const noexcept
    {
        return find(key) != nullptr;
    }

    bool map::operator==(const map &o) const
    {
        if (size() != o.size())
            return false;
        for (const auto &[k, v]: *this) {
            const auto *ov = o.find(k);
            if (!ov || !(*ov == v))
                return false;
        }
        return true;
    }

    value value::from_uint(const uint64_t magnitude)
    {
        if (magnitude <= static_cast<uint64_t>(max_safe_integer))
            return value { content_type { std::in_place_type<int64_t>, static_cast<int64_t>(magnitude) } };
        return value { content_type { std::in_place_type<cpp_int>, magnitude } };
    }

    value value::from_nint(const uint64_t magnitude)
    {
        if (magnitude < static_cast<uint64_t>(max_safe_integer))
            return value { content_type { std::in_place_type<int64_t>, -1 - static_cast<int64_t>(magnitude) } };
        cpp_int v { magnitude };
        v = -1 - v;
        return value { content_type { std::in_place_type<cpp_int>, std::move(v) } };
    }

    value value::from_bigint(const cpp_int &v)
    {
        if (is_safe_integer(v))
            return value { content_type { std::in_place_type<int64_t>, static_cast<int64_t>(v) } };
        return value { content_type { std::in_place_type<cpp_int>, v } };
    }

    cpp_int value::bigint(const std::source_location &loc) const
    {
        switch (type()) {
            case value_type::integer: return cpp_int { std::get<int64_t>(_content) };
            case value_type::big_integer: return std::get<cpp_int>(_content);
            default: throw error(fmt::format("cannot interpret {} as an integer at {}", type(), loc));
        }
    }

    bool value::boolean(const std::source_location &loc) const
    {
        switch (const auto s = simple_val(loc); s) {
            case simple::s_false: return false;
            case simple::s_true: return true;
            default: throw error(fmt::format("cannot interpret {} as a boolean at {}", s, loc));
        }
    }

    const value &value::at(const size_t idx, const std::source_location &loc) const
    {
        const auto &items = array(loc);
        if (idx >= items.size()) [[unlikely]]
            throw error(fmt::format("index {} is out of range of an array of size {} at {}", idx, items.size(), loc));
        return items[idx];
    }

    const value &value::at(const std::string_view key, const std::source_location &loc) const
    {
        return map(loc).at(key, loc);
    }

    bool value::operator==(const value &o) const
    {
        if (valueless() || o.valueless())
            return valueless() && o.valueless();
        if (_content.index() != o._content.index())
            return false;
        return std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            return v == std::get<T>(o._content);
        }, _content);
    }

    static std::back_insert_iterator<std::string> stringify_text(std::back_insert_iterator<std::string> out_it, const std::string_view s)
    {
        *out_it++ = '"';
        for (const char c: s) {
            switch (c) {
                case '"': out_it = fmt::format_to(out_it, "\\\""); break;
                case '\\': out_it = fmt::format_to(out_it, "\\\\"); break;
                case '\n': out_it = fmt::format_to(out_it, "\\n"); break;
                case '\r': out_it = fmt::format_to(out_it, "\\r"); break;
                case '\t': out_it = fmt::format_to(out_it, "\\t"); break;
                default:
                    if (static_cast<uint8_t>(c) < 0x20)
                        out_it = fmt::format_to(out_it, "\\u{:04x}", static_cast<int>(c));
                    else
                        *out_it++ = c;
                    break;
            }
        }
        *out_it++ = '"';
        return out_it;
    }

    static std::back_insert_iterator<std::string> stringify_value(std::back_insert_iterator<std::string> out_it, const value &v)
    {
        if (v.valueless()) [[unlikely]]
            throw error("cannot stringify a valueless cbor::value");
        return std::visit([&](const auto &cv) {
            using T = std::decay_t<decltype(cv)>;
            if constexpr (std::is_same_v<T, int64_t>) {
                return fmt::format_to(out_it, "{}", cv);
            } else if constexpr (std::is_same_v<T, cpp_int>) {
                return fmt::format_to(out_it, "{}", cv);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return stringify_text(out_it, cv);
            } else if constexpr (std::is_same_v<T, bytes>) {
                return fmt::format_to(out_it, "h'{}'", cv);
            } else if constexpr (std::is_same_v<T, array>) {
                *out_it++ = '[';
                for (size_t i = 0; i < cv.size(); ++i) {
                    if (i > 0)
                        out_it = fmt::format_to(out_it, ", ");
                    out_it = stringify_value(out_it, cv[i]);
                }
                *out_it++ = ']';
                return out_it;
            } else if constexpr (std::is_same_v<T, map>) {
                *out_it++ = '{';
                bool first = true;
                for (const auto &[k, iv]: cv) {
                    if (!first)
                        out_it = fmt::format_to(out_it, ", ");
                    first = false;
                    out_it = stringify_text(out_it, k);
                    out_it = fmt::format_to(out_it, ": ");
                    out_it = stringify_value(out_it, iv);
                }
                *out_it++ = '}';
                return out_it;
            } else if constexpr (std::is_same_v<T, simple>) {
                return fmt::format_to(out_it, "{}", cv);
            } else {
                throw error(fmt::format("unsupported cbor::value type: {}", typeid(T).name()));
            }
        }, v.content());
    }

    std::string stringify(const value &v)
    {
        std::string res {};
        stringify_value(std::back_inserter(res), v);
        return res;
    }
}
