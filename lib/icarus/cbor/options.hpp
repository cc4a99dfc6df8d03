/* This file is part of Icarus CBOR project.
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CBOR_OPTIONS_HPP
#define ICARUS_CBOR_OPTIONS_HPP

#include <cstddef>
#include <icarus/cbor/utf8.hpp>

namespace icarus::cbor {
    struct decode_options {
        size_t max_depth = 1024;
        utf8_policy utf8 = utf8_policy::lossy;
    };

    struct encode_options {
        size_t initial_capacity = 2 * 1024;
        // the headroom a region keeps free for the next header before it grows
        size_t safe_margin = 100;
    };
}

#endif // !ICARUS_CBOR_OPTIONS_HPP
