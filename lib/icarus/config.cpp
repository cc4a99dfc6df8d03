/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdlib>
#include <icarus/config.hpp>
#include <icarus/logger.hpp>

namespace icarus {
    static size_t config_size(const json::value &v, const std::string_view name)
    {
        if (!v.is_int64() && !v.is_uint64())
            throw icarus::error(fmt::format("config element {} must be an integer but got: {}", name, json::serialize(v)));
        if (v.is_int64() && v.as_int64() < 0)
            throw icarus::error(fmt::format("config element {} must not be negative but got: {}", name, v.as_int64()));
        return v.to_number<size_t>();
    }

    static const json::object &config_section(const json::value &v, const std::string_view name)
    {
        if (!v.is_object())
            throw icarus::error(fmt::format("config element {} must be an object but got: {}", name, json::serialize(v)));
        return v.get_object();
    }

    static void parse_decode(cbor::decode_options &opts, const json::object &j)
    {
        for (const auto &[k, v]: j) {
            if (k == "maxDepth") {
                opts.max_depth = config_size(v, "decode.maxDepth");
            } else if (k == "utf8") {
                if (!v.is_string())
                    throw icarus::error(fmt::format("config element decode.utf8 must be a string but got: {}", json::serialize(v)));
                opts.utf8 = cbor::utf8_policy_from_string(static_cast<std::string_view>(v.get_string()));
            } else {
                throw icarus::error(fmt::format("unsupported config element: decode.{}", static_cast<std::string_view>(k)));
            }
        }
    }

    static void parse_encode(cbor::encode_options &opts, const json::object &j)
    {
        for (const auto &[k, v]: j) {
            if (k == "initialCapacity") {
                opts.initial_capacity = config_size(v, "encode.initialCapacity");
            } else if (k == "safeMargin") {
                opts.safe_margin = config_size(v, "encode.safeMargin");
            } else {
                throw icarus::error(fmt::format("unsupported config element: encode.{}", static_cast<std::string_view>(k)));
            }
        }
    }

    codec_config codec_config::from_json(const json::object &j)
    {
        codec_config cfg {};
        for (const auto &[k, v]: j) {
            if (k == "decode") {
                parse_decode(cfg.decode, config_section(v, "decode"));
            } else if (k == "encode") {
                parse_encode(cfg.encode, config_section(v, "encode"));
            } else {
                throw icarus::error(fmt::format("unsupported config element: {}", static_cast<std::string_view>(k)));
            }
        }
        cfg.validate();
        return cfg;
    }

    codec_config codec_config::from_file(const std::string &path)
    {
        const auto j = json::load(path);
        if (!j.is_object())
            throw icarus::error(fmt::format("the config file {} must contain a JSON object", path));
        try {
            return from_json(j.get_object());
        } catch (const std::exception &ex) {
            throw icarus::error(fmt::format("invalid config file {}", path), ex);
        }
    }

    codec_config codec_config::from_env()
    {
        if (const char *path = std::getenv("ICARUS_CONFIG"); path) {
            logger::debug("loading the codec config from {}", path);
            return from_file(path);
        }
        return {};
    }

    void codec_config::validate() const
    {
        if (decode.max_depth == 0)
            throw icarus::error("decode.maxDepth must be larger than 0");
        if (encode.initial_capacity <= encode.safe_margin)
            throw icarus::error(fmt::format("encode.initialCapacity: {} must be larger than encode.safeMargin: {}",
                encode.initial_capacity, encode.safe_margin));
    }
}
