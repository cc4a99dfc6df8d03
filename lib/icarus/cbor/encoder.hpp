/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CBOR_ENCODER_HPP
#define ICARUS_CBOR_ENCODER_HPP

#include <optional>
#include <string_view>
#include <icarus/common/bytes.hpp>
#include <icarus/cbor/header.hpp>
#include <icarus/cbor/options.hpp>
#include <icarus/cbor/region.hpp>
#include <icarus/cbor/transform.hpp>
#include <icarus/cbor/value.hpp>

namespace icarus::cbor {
    struct encoder {
        explicit encoder(replacer rep={}, const encode_options &opts={});

        encoder &self_described_tag();
        // a top-level item, the replacer sees it with no key
        encoder &value(const cbor::value &v);

        [[nodiscard]] size_t size() const noexcept
        {
            return _out.offset();
        }

        [[nodiscard]] uint8_vector cbor() const
        {
            return _out.release();
        }
    private:
        region _out;
        const replacer _rep;

        void _write_item(const cbor::value &v, std::optional<std::string_view> key);
        void _write_value(const cbor::value &v);
        void _write_int(int64_t v);
        void _write_bigint(const cpp_int &v);
        void _write_text(std::string_view s);
        void _write_bytes(buffer b);
        void _write_array(const array &items);
        void _write_map(const map &items);
        void _write_simple(simple s);
    };

    extern uint8_vector encode(const value &v, const replacer &rep={}, const encode_options &opts={});
    extern uint8_vector encode_with_self_described_tag(const value &v, const replacer &rep={}, const encode_options &opts={});
}

#endif // !ICARUS_CBOR_ENCODER_HPP
