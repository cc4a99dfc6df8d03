/* This file is part of Icarus CBOR project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <iterator>
#include <utf8cpp/utf8.h>
#include <icarus/cbor/error.hpp>
#include <icarus/cbor/utf8.hpp>

namespace icarus::cbor {
    utf8_policy utf8_policy_from_string(const std::string_view name)
    {
        if (name == "lossy")
            return utf8_policy::lossy;
        if (name == "strict")
            return utf8_policy::strict;
        throw error(fmt::format("unsupported utf8 policy: '{}'", name));
    }

    std::string decode_utf8(const buffer bytes, const utf8_policy policy)
    {
        const std::string_view sv = bytes;
        const auto invalid_it = utf8::find_invalid(sv.begin(), sv.end());
        if (invalid_it == sv.end()) [[likely]]
            return std::string { sv };
        switch (policy) {
            case utf8_policy::lossy: {
                std::string res {};
                res.reserve(sv.size());
                utf8::replace_invalid(sv.begin(), sv.end(), std::back_inserter(res));
                return res;
            }
            case utf8_policy::strict:
                throw decoding_error(fmt::format("Invalid UTF-8 sequence in a text string at byte {}",
                    std::distance(sv.begin(), invalid_it)));
            default:
                throw error(fmt::format("unsupported utf8 policy: {}", policy));
        }
    }
}
