/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CBOR_ERROR_HPP
#define ICARUS_CBOR_ERROR_HPP

#include <icarus/common/error.hpp>

namespace icarus::cbor {
    typedef icarus::error error;

    // malformed or truncated input
    struct decoding_error: error {
        using error::error;
    };

    // a value that has no CBOR representation
    struct encoding_error: error {
        using error::error;
    };
}

#endif // !ICARUS_CBOR_ERROR_HPP
