/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CBOR_DECODER_HPP
#define ICARUS_CBOR_DECODER_HPP

#include <icarus/common/bytes.hpp>
#include <icarus/cbor/header.hpp>
#include <icarus/cbor/options.hpp>
#include <icarus/cbor/transform.hpp>
#include <icarus/cbor/value.hpp>

namespace icarus::cbor {
    // Reads top-level items one after another from a single input buffer.
    // Bytes following an item are left unread until the next read() call.
    struct decoder {
        explicit decoder(buffer bytes, reviver rev={}, const decode_options &opts={});

        value read();

        bool done() const noexcept
        {
            return _cur.eof();
        }

        size_t offset() const noexcept
        {
            return _cur.offset();
        }
    private:
        cursor _cur;
        const reviver _rev;
        const decode_options _opts;

        value _read_item(size_t depth);
        value _read_array(const header &h, size_t depth);
        value _read_map(const header &h, size_t depth);
        value _read_tag(const header &h, size_t depth);
        value _read_simple(const header &h);
        uint8_vector _read_byte_string(const header &h);
        std::string _read_text_string(const header &h);
        void _read_chunk(const header &h, uint8_vector &out);
        void _read_map_item(const header &key_h, map &res, size_t depth);
    };

    // The first item of the input. Any bytes after it are ignored.
    extern value decode(buffer bytes, const reviver &rev={}, const decode_options &opts={});
}

#endif // !ICARUS_CBOR_DECODER_HPP
