/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CBOR_HEADER_HPP
#define ICARUS_CBOR_HEADER_HPP

#include <limits>
#include <optional>
#include <icarus/big-int.hpp>
#include <icarus/common/bytes.hpp>
#include <icarus/cbor/error.hpp>
#include <icarus/cbor/region.hpp>
#include <icarus/cbor/types.hpp>

namespace icarus::cbor {
    struct header {
        major_type major;
        uint8_t info;

        bool operator==(const header &o) const noexcept =default;

        bool is_break() const noexcept
        {
            return major == major_type::simple && info == static_cast<uint8_t>(special_val::s_break);
        }
    };

    // A read-only view of the input with a read offset that only moves forward.
    struct cursor {
        explicit cursor(const buffer bytes):
            _bytes { bytes }
        {
        }

        cursor(const cursor &) =delete;

        bool eof() const noexcept
        {
            return _offset >= _bytes.size();
        }

        size_t offset() const noexcept
        {
            return _offset;
        }

        size_t remaining() const noexcept
        {
            return _bytes.size() - _offset;
        }

        uint8_t peek() const
        {
            if (eof()) [[unlikely]]
                _throw_eof();
            return _bytes[_offset];
        }

        header read_header()
        {
            const uint8_t b = peek();
            ++_offset;
            return { static_cast<major_type>(b >> 5), static_cast<uint8_t>(b & 0x1F) };
        }

        buffer read_bytes(const size_t sz)
        {
            if (sz > remaining()) [[unlikely]]
                throw decoding_error(fmt::format("Unexpected end of CBOR data at byte {}: requested {} bytes but only {} remain",
                    _offset, sz, remaining()));
            const auto res = _bytes.subbuf(_offset, sz);
            _offset += sz;
            return res;
        }

        // the argument of a header with a definite value
        uint64_t read_uint(const header &h)
        {
            if (h.info <= max_literal_info)
                return h.info;
            switch (static_cast<special_val>(h.info)) {
                case special_val::one_byte: return read_bytes(1).to_host<uint8_t>();
                case special_val::two_bytes: return read_bytes(2).to_host<uint16_t>();
                case special_val::four_bytes: return read_bytes(4).to_host<uint32_t>();
                case special_val::eight_bytes: return read_bytes(8).to_host<uint64_t>();
                default: throw decoding_error(fmt::format("Unsupported integer info: {:b}", h.info));
            }
        }

        // std::nullopt stands for an indefinite length
        std::optional<uint64_t> read_length(const header &h)
        {
            if (h.info == static_cast<uint8_t>(special_val::s_break)) {
                switch (h.major) {
                    case major_type::bytes:
                    case major_type::text:
                    case major_type::array:
                    case major_type::map:
                        return {};
                    default:
                        throw decoding_error(fmt::format("Unsupported integer info: {:b}", h.info));
                }
            }
            return read_uint(h);
        }
    private:
        const buffer _bytes;
        size_t _offset = 0;

        [[noreturn]] void _throw_eof() const
        {
            if (_offset == 0)
                throw decoding_error("Provided CBOR data is empty");
            throw decoding_error(fmt::format("Unexpected end of CBOR data at byte {}", _offset));
        }
    };

    // always uses the shortest of the five possible encodings
    inline void write_header(region &out, const major_type typ, const uint64_t val)
    {
        out.prepare_header();
        if (val <= max_literal_info) {
            out.write(make_header_byte(typ, static_cast<uint8_t>(val)));
        } else if (val <= std::numeric_limits<uint8_t>::max()) {
            out.write(make_header_byte(typ, static_cast<uint8_t>(special_val::one_byte)));
            out.write(static_cast<uint8_t>(val));
        } else if (val <= std::numeric_limits<uint16_t>::max()) {
            out.write(make_header_byte(typ, static_cast<uint8_t>(special_val::two_bytes)));
            out.write(buffer::from(host_to_net<uint16_t>(val)));
        } else if (val <= std::numeric_limits<uint32_t>::max()) {
            out.write(make_header_byte(typ, static_cast<uint8_t>(special_val::four_bytes)));
            out.write(buffer::from(host_to_net<uint32_t>(val)));
        } else {
            out.write(make_header_byte(typ, static_cast<uint8_t>(special_val::eight_bytes)));
            out.write(buffer::from(host_to_net<uint64_t>(val)));
        }
    }

    inline void write_header(region &out, const major_type typ, const cpp_int &val)
    {
        if (val < 0 || val > big_uint64_max()) [[unlikely]]
            throw encoding_error(fmt::format("Value too large to encode: {}", val));
        write_header(out, typ, static_cast<uint64_t>(val));
    }
}

namespace fmt {
    template<>
    struct formatter<icarus::cbor::header>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}:{}", v.major, static_cast<int>(v.info));
        }
    };
}

#endif // !ICARUS_CBOR_HEADER_HPP
