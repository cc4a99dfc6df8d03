/* This file is part of Icarus CBOR project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CBOR_REGION_HPP
#define ICARUS_CBOR_REGION_HPP

#include <cstring>
#include <icarus/common/bytes.hpp>
#include <icarus/cbor/error.hpp>
#include <icarus/cbor/options.hpp>

namespace icarus::cbor {
    // The output of a single encode call. capacity() is the full size of the underlying write_vector,
    // offset() is the number of bytes written so far.
    struct region {
        explicit region(const encode_options &opts={}):
            _margin { opts.safe_margin }
        {
            if (opts.initial_capacity <= opts.safe_margin) [[unlikely]]
                throw error(fmt::format("the initial capacity of an output region: {} must be larger than its safe margin: {}",
                    opts.initial_capacity, opts.safe_margin));
            _buf.resize(opts.initial_capacity);
        }

        region(const region &) =delete;

        size_t offset() const noexcept
        {
            return _offset;
        }

        size_t capacity() const noexcept
        {
            return _buf.size();
        }

        // must be called before each header so that a header never lands in the last safe_margin bytes
        void prepare_header()
        {
            while (_offset > capacity() - _margin)
                _buf.resize(capacity() * 2);
        }

        void write(const uint8_t b)
        {
            _fit(1);
            _buf.data()[_offset++] = b;
        }

        void write(const buffer bytes)
        {
            if (bytes.empty())
                return;
            _fit(bytes.size());
            memcpy(_buf.data() + _offset, bytes.data(), bytes.size());
            _offset += bytes.size();
        }

        buffer data() const noexcept
        {
            return { _buf.data(), _offset };
        }

        // a copy of exactly the written bytes
        uint8_vector release() const
        {
            return uint8_vector { data() };
        }
    private:
        write_vector _buf {};
        size_t _offset = 0;
        const size_t _margin;

        void _fit(const size_t sz)
        {
            if (capacity() - _offset < sz)
                _buf.resize(_offset + sz);
        }
    };
}

#endif // !ICARUS_CBOR_REGION_HPP
