/* This file is part of Icarus CBOR project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CBOR_UTF8_HPP
#define ICARUS_CBOR_UTF8_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <icarus/common/bytes.hpp>

namespace icarus::cbor {
    enum class utf8_policy: uint8_t {
        // invalid sequences are replaced with U+FFFD
        lossy,
        // invalid sequences fail the decode
        strict
    };

    extern utf8_policy utf8_policy_from_string(std::string_view name);
    extern std::string decode_utf8(buffer bytes, utf8_policy policy);
}

namespace fmt {
    template<>
    struct formatter<icarus::cbor::utf8_policy>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using icarus::cbor::utf8_policy;
            switch (v) {
                case utf8_policy::lossy: return fmt::format_to(ctx.out(), "lossy");
                case utf8_policy::strict: return fmt::format_to(ctx.out(), "strict");
                default: return fmt::format_to(ctx.out(), "utf8_policy: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !ICARUS_CBOR_UTF8_HPP
