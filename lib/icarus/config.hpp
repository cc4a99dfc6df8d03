/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_CONFIG_HPP
#define ICARUS_CONFIG_HPP

#include <string>
#include <icarus/json.hpp>
#include <icarus/cbor/options.hpp>

namespace icarus {
    // The codec options of an application, by default taken from the JSON file named by ICARUS_CONFIG.
    // Recognized layout: { "decode": { "maxDepth": 1024, "utf8": "lossy" }, "encode": { "initialCapacity": 2048, "safeMargin": 100 } }
    struct codec_config {
        static codec_config from_json(const json::object &j);
        static codec_config from_file(const std::string &path);
        static codec_config from_env();

        cbor::decode_options decode {};
        cbor::encode_options encode {};

        void validate() const;
    };
}

#endif // !ICARUS_CONFIG_HPP
