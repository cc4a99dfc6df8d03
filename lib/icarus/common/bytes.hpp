/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_COMMON_BYTES_HPP
#define ICARUS_COMMON_BYTES_HPP

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "error.hpp"
#include "format.hpp"

namespace icarus {
    // CBOR multi-byte fields are big-endian
    template <typename T>
    T host_to_net(T value) noexcept
    {
        const int x = 1;
        if (*reinterpret_cast<const char *>(&x) == 1) {
            char* ptr = reinterpret_cast<char*>(&value);
            std::reverse(ptr, ptr + sizeof(T));
        }
        return value;
    }

    struct buffer: std::span<const uint8_t> {
        buffer() =default;
        buffer(const buffer &) =default;

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        buffer(const std::string_view s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer(const std::string &s):
            buffer { std::string_view { s } }
        {
        }

        buffer &operator=(const buffer &o) =default;

        // the in-memory representation of an object, valid for as long as the object lives
        template<typename M>
        static buffer from(const M &val)
        {
            return buffer { reinterpret_cast<const uint8_t *>(&val), sizeof(val) };
        }

        template<typename M>
        M to_host() const
        {
            if (size() != sizeof(M)) [[unlikely]]
                throw error(fmt::format("cannot read a {}-byte integer from a buffer of {} bytes", sizeof(M), size()));
            M val;
            memcpy(&val, data(), sizeof(val));
            return host_to_net(val);
        }

        operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        bool operator==(const buffer &o) const noexcept
        {
            return size() == o.size() && (empty() || memcmp(data(), o.data(), size()) == 0);
        }

        buffer subbuf(const size_t offset, const size_t sz) const
        {
            if (offset + sz <= size() && offset + sz >= offset) [[likely]]
                return buffer { data() + offset, sz };
            throw error(fmt::format("a slice at offset {} of {} bytes ends past the end of a {}-byte buffer", offset, sz, size()));
        }
    };

    inline uint8_t uint_from_hex(const char k)
    {
        const int c = std::tolower(static_cast<unsigned char>(k));
        if (c >= '0' && c <= '9')
            return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f')
            return static_cast<uint8_t>(c - 'a' + 10);
        throw error(fmt::format("unexpected character in a hex string: {}", k));
    }

    struct uint8_vector: std::vector<uint8_t> {
        static uint8_vector from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0)
                throw error(fmt::format("a hex string must have an even number of characters but got {}", hex.size()));
            uint8_vector res(hex.size() / 2);
            for (size_t i = 0; i < res.size(); ++i)
                res[i] = uint_from_hex(hex[i * 2]) << 4 | uint_from_hex(hex[i * 2 + 1]);
            return res;
        }

        uint8_vector() =default;

        explicit uint8_vector(const size_t sz):
            std::vector<uint8_t>(sz)
        {
        }

        uint8_vector(std::initializer_list<uint8_t> bytes):
            std::vector<uint8_t> { bytes }
        {
        }

        uint8_vector(const buffer bytes):
            std::vector<uint8_t> { bytes.begin(), bytes.end() }
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        std::string_view str() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) == static_cast<buffer>(o);
        }

        bool operator==(const buffer &o) const noexcept
        {
            return static_cast<buffer>(*this) == o;
        }
    };

    // A growable output buffer that leaves newly allocated memory uninitialized.
    struct write_vector {
        write_vector() =default;
        write_vector(const write_vector &) =delete;

        void resize(const size_t new_sz)
        {
            if (new_sz > _capacity) {
                ptr_type new_ptr { static_cast<uint8_t *>(::operator new(new_sz)) };
                if (_size)
                    memcpy(new_ptr.get(), _ptr.get(), _size);
                _ptr = std::move(new_ptr);
                _capacity = new_sz;
            }
            _size = new_sz;
        }

        size_t size() const noexcept
        {
            return _size;
        }

        // nullptr until the first resize
        uint8_t *data() const noexcept
        {
            return _ptr.get();
        }
    private:
        struct deleter_t {
            void operator()(uint8_t *ptr) const
            {
                ::operator delete(ptr);
            }
        };
        using ptr_type = std::unique_ptr<uint8_t, deleter_t>;

        size_t _capacity = 0;
        size_t _size = 0;
        ptr_type _ptr {};
    };

    inline uint8_vector &operator<<(uint8_vector &v, const buffer buf)
    {
        v.insert(v.end(), buf.begin(), buf.end());
        return v;
    }
}

namespace fmt {
    template<>
    struct formatter<icarus::buffer>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<icarus::uint8_vector>: formatter<icarus::buffer> {
        template<typename FormatContext>
        auto format(const icarus::uint8_vector &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<icarus::buffer>::format(icarus::buffer { v.data(), v.size() }, ctx);
        }
    };
}

#endif // !ICARUS_COMMON_BYTES_HPP
