/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <typeinfo>
#include <icarus/cbor/encoder.hpp>

namespace icarus::cbor {
    encoder::encoder(replacer rep, const encode_options &opts):
        _out { opts }, _rep { std::move(rep) }
    {
    }

    encoder &encoder::self_described_tag()
    {
        write_header(_out, major_type::tag, cbor::self_described_tag);
        return *this;
    }

    encoder &encoder::value(const cbor::value &v)
    {
        _write_item(v, std::nullopt);
        return *this;
    }

    void encoder::_write_item(const cbor::value &v, const std::optional<std::string_view> key)
    {
        if (_rep) {
            const auto replaced = _rep(v, key);
            _write_value(replaced);
        } else {
            _write_value(v);
        }
    }

    void encoder::_write_value(const cbor::value &v)
    {
        if (v.valueless()) [[unlikely]]
            throw encoding_error("Unsupported type: valueless");
        std::visit([&](const auto &cv) {
            using T = std::decay_t<decltype(cv)>;
            if constexpr (std::is_same_v<T, int64_t>) {
                _write_int(cv);
            } else if constexpr (std::is_same_v<T, cpp_int>) {
                _write_bigint(cv);
            } else if constexpr (std::is_same_v<T, std::string>) {
                _write_text(cv);
            } else if constexpr (std::is_same_v<T, bytes>) {
                _write_bytes(cv);
            } else if constexpr (std::is_same_v<T, array>) {
                _write_array(cv);
            } else if constexpr (std::is_same_v<T, map>) {
                _write_map(cv);
            } else if constexpr (std::is_same_v<T, simple>) {
                _write_simple(cv);
            } else {
                throw encoding_error(fmt::format("Unsupported type: {}", typeid(T).name()));
            }
        }, v.content());
    }

    void encoder::_write_int(const int64_t v)
    {
        if (v >= 0)
            write_header(_out, major_type::uint, static_cast<uint64_t>(v));
        else
            write_header(_out, major_type::nint, static_cast<uint64_t>(-1 - v));
    }

    void encoder::_write_bigint(const cpp_int &v)
    {
        if (v >= 0)
            write_header(_out, major_type::uint, v);
        else
            write_header(_out, major_type::nint, cpp_int { -1 - v });
    }

    void encoder::_write_text(const std::string_view s)
    {
        write_header(_out, major_type::text, s.size());
        _out.write(buffer { s });
    }

    void encoder::_write_bytes(const buffer b)
    {
        write_header(_out, major_type::bytes, b.size());
        _out.write(b);
    }

    void encoder::_write_array(const array &items)
    {
        write_header(_out, major_type::array, items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            if (_rep)
                _write_item(items[i], index_key(i));
            else
                _write_value(items[i]);
        }
    }

    void encoder::_write_map(const map &items)
    {
        write_header(_out, major_type::map, items.size());
        for (const auto &[k, v]: items) {
            _write_text(k);
            _write_item(v, k);
        }
    }

    void encoder::_write_simple(const simple s)
    {
        switch (s) {
            case simple::s_false:
            case simple::s_true:
            case simple::s_null:
            case simple::s_undefined:
                write_header(_out, major_type::simple, static_cast<uint64_t>(s));
                break;
            default:
                throw encoding_error(fmt::format("Unrecognized simple value: {}", static_cast<int>(s)));
        }
    }

    uint8_vector encode(const value &v, const replacer &rep, const encode_options &opts)
    {
        return encoder { rep, opts }.value(v).cbor();
    }

    uint8_vector encode_with_self_described_tag(const value &v, const replacer &rep, const encode_options &opts)
    {
        return encoder { rep, opts }.self_described_tag().value(v).cbor();
    }
}
