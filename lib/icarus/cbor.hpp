/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CBOR_HPP
#define ICARUS_CBOR_HPP

#include <icarus/cbor/decoder.hpp>
#include <icarus/cbor/encoder.hpp>
#include <icarus/cbor/error.hpp>
#include <icarus/cbor/options.hpp>
#include <icarus/cbor/transform.hpp>
#include <icarus/cbor/value.hpp>

#endif // !ICARUS_CBOR_HPP
