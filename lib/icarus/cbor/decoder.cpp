/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <icarus/cbor/decoder.hpp>
#include <icarus/cbor/utf8.hpp>

namespace icarus::cbor {
    decoder::decoder(const buffer bytes, reviver rev, const decode_options &opts):
        _cur { bytes }, _rev { std::move(rev) }, _opts { opts }
    {
        if (_opts.max_depth == 0) [[unlikely]]
            throw error("decode_options::max_depth must be larger than 0");
    }

    value decoder::read()
    {
        auto res = _read_item(0);
        return apply_transform(_rev, std::move(res), std::nullopt);
    }

    value decoder::_read_item(const size_t depth)
    {
        if (depth > _opts.max_depth) [[unlikely]]
            throw decoding_error(fmt::format("Maximum nesting depth of {} exceeded", _opts.max_depth));
        const auto h = _cur.read_header();
        switch (h.major) {
            case major_type::uint: return value::from_uint(_cur.read_uint(h));
            case major_type::nint: return value::from_nint(_cur.read_uint(h));
            case major_type::bytes: return _read_byte_string(h);
            case major_type::text: return _read_text_string(h);
            case major_type::array: return _read_array(h, depth);
            case major_type::map: return _read_map(h, depth);
            case major_type::tag: return _read_tag(h, depth);
            case major_type::simple: return _read_simple(h);
            default: throw decoding_error("Unsupported major type");
        }
    }

    value decoder::_read_array(const header &h, const size_t depth)
    {
        array res {};
        if (const auto sz = _cur.read_length(h); sz) {
            // every item takes at least one byte
            if (*sz > _cur.remaining()) [[unlikely]]
                throw decoding_error(fmt::format("Collection length is too large: {} items with {} bytes remaining", *sz, _cur.remaining()));
            res.reserve(*sz);
            for (size_t i = 0; i < *sz; ++i) {
                auto item = _read_item(depth + 1);
                if (_rev)
                    item = _rev(std::move(item), index_key(i));
                res.emplace_back(std::move(item));
            }
        } else {
            while (_cur.peek() != break_byte) {
                auto item = _read_item(depth + 1);
                if (_rev)
                    item = _rev(std::move(item), index_key(res.size()));
                res.emplace_back(std::move(item));
            }
            _cur.read_header();
        }
        return res;
    }

    // the break marker of an indefinite map never reaches here
    void decoder::_read_map_item(const header &key_h, map &res, const size_t depth)
    {
        if (key_h.major != major_type::text) [[unlikely]]
            throw decoding_error("Map keys must be text strings");
        auto key = _read_text_string(key_h);
        auto val = _read_item(depth + 1);
        if (_rev)
            val = _rev(std::move(val), std::string_view { key });
        // a repeated key replaces the earlier value
        res.set(std::move(key), std::move(val));
    }

    value decoder::_read_map(const header &h, const size_t depth)
    {
        map res {};
        if (const auto sz = _cur.read_length(h); sz) {
            // every key and value take at least one byte each
            if (*sz > _cur.remaining() / 2) [[unlikely]]
                throw decoding_error(fmt::format("Collection length is too large: {} pairs with {} bytes remaining", *sz, _cur.remaining()));
            res.reserve(*sz);
            for (size_t i = 0; i < *sz; ++i)
                _read_map_item(_cur.read_header(), res, depth);
        } else {
            for (;;) {
                const auto key_h = _cur.read_header();
                if (key_h.is_break())
                    break;
                _read_map_item(key_h, res, depth);
            }
        }
        return res;
    }

    value decoder::_read_tag(const header &h, const size_t depth)
    {
        const auto tag = _cur.read_uint(h);
        if (tag != self_described_tag) [[unlikely]]
            throw decoding_error(fmt::format("Unsupported tag: {}", tag));
        return _read_item(depth + 1);
    }

    value decoder::_read_simple(const header &h)
    {
        switch (static_cast<special_val>(h.info)) {
            case special_val::s_false: return false;
            case special_val::s_true: return true;
            case special_val::s_null: return simple::s_null;
            case special_val::s_undefined: return simple::s_undefined;
            case special_val::s_break: throw decoding_error("Unexpected break marker");
            default: throw decoding_error(fmt::format("Unrecognized simple type: {:b}", h.info));
        }
    }

    void decoder::_read_chunk(const header &h, uint8_vector &out)
    {
        const auto sz = _cur.read_uint(h);
        if (sz > _cur.remaining()) [[unlikely]]
            throw decoding_error(fmt::format("Byte length is too large: {} with {} bytes remaining", sz, _cur.remaining()));
        out << _cur.read_bytes(sz);
    }

    uint8_vector decoder::_read_byte_string(const header &h)
    {
        uint8_vector res {};
        if (h.info != static_cast<uint8_t>(special_val::s_break)) {
            _read_chunk(h, res);
            return res;
        }
        for (;;) {
            const auto chunk_h = _cur.read_header();
            if (chunk_h.is_break())
                break;
            if (chunk_h.major != h.major || chunk_h.info == static_cast<uint8_t>(special_val::s_break)) [[unlikely]]
                throw decoding_error(fmt::format("Invalid chunk in an indefinite-length string: {}", chunk_h));
            _read_chunk(chunk_h, res);
        }
        return res;
    }

    std::string decoder::_read_text_string(const header &h)
    {
        return decode_utf8(_read_byte_string(h), _opts.utf8);
    }

    value decode(const buffer bytes, const reviver &rev, const decode_options &opts)
    {
        return decoder { bytes, rev, opts }.read();
    }
}
