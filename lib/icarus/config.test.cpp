/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <icarus/config.hpp>
#include <icarus/common/test.hpp>

using namespace icarus;

namespace {
    static void my_setenv(const char *name, const char *val)
    {
        if (name == nullptr)
            throw error("my_setenv: name cannot be null!");
#if _WIN32
        std::string putexpr { fmt::format("{}={}", name, val != nullptr ? val : "") };
        putenv(putexpr.c_str());
#else
        if (val != nullptr)
            setenv(name, val, 1);
        else
            unsetenv(name);
#endif
    }

    static std::string write_tmp_config(const std::string_view name, const std::string_view text)
    {
        const auto path = (std::filesystem::temp_directory_path() / name).string();
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys(fmt::format("failed to open {} for writing", path));
        os << text;
        return path;
    }

    static json::object parse_object(const std::string_view text)
    {
        return json::parse(buffer { text }).as_object();
    }
}

suite config_suite = [] {
    "config"_test = [] {
        "defaults"_test = [] {
            const codec_config cfg {};
            test_same(size_t { 1024 }, cfg.decode.max_depth);
            test_same(cbor::utf8_policy::lossy, cfg.decode.utf8);
            test_same(size_t { 2048 }, cfg.encode.initial_capacity);
            test_same(size_t { 100 }, cfg.encode.safe_margin);
            expect(nothrow([&] { cfg.validate(); }));
        };
        "from_json"_test = [] {
            const auto cfg = codec_config::from_json(parse_object(
                R"({ "decode": { "maxDepth": 16, "utf8": "strict" }, "encode": { "initialCapacity": 64, "safeMargin": 8 } })"));
            test_same(size_t { 16 }, cfg.decode.max_depth);
            test_same(cbor::utf8_policy::strict, cfg.decode.utf8);
            test_same(size_t { 64 }, cfg.encode.initial_capacity);
            test_same(size_t { 8 }, cfg.encode.safe_margin);
        };
        "partial"_test = [] {
            const auto cfg = codec_config::from_json(parse_object(R"({ "decode": { "maxDepth": 3 } })"));
            test_same(size_t { 3 }, cfg.decode.max_depth);
            test_same(cbor::utf8_policy::lossy, cfg.decode.utf8);
            test_same(size_t { 2048 }, cfg.encode.initial_capacity);
        };
        "unknown elements"_test = [] {
            expect_throws_msg([] { codec_config::from_json(parse_object(R"({ "decoder": {} })")); }, "unsupported config element: decoder");
            expect_throws_msg([] { codec_config::from_json(parse_object(R"({ "decode": { "depth": 1 } })")); }, "unsupported config element: decode.depth");
            expect_throws_msg([] { codec_config::from_json(parse_object(R"({ "encode": { "margin": 1 } })")); }, "unsupported config element: encode.margin");
        };
        "wrong types"_test = [] {
            expect_throws_msg([] { codec_config::from_json(parse_object(R"({ "decode": 1 })")); }, "config element decode must be an object");
            expect_throws_msg([] { codec_config::from_json(parse_object(R"({ "decode": { "maxDepth": "1" } })")); }, "config element decode.maxDepth must be an integer");
            expect_throws_msg([] { codec_config::from_json(parse_object(R"({ "decode": { "maxDepth": -1 } })")); }, "config element decode.maxDepth must not be negative");
            expect_throws_msg([] { codec_config::from_json(parse_object(R"({ "decode": { "utf8": true } })")); }, "config element decode.utf8 must be a string");
            expect_throws_msg([] { codec_config::from_json(parse_object(R"({ "decode": { "utf8": "ascii" } })")); }, "unsupported utf8 policy: 'ascii'");
        };
        "validate"_test = [] {
            expect_throws_msg([] { codec_config::from_json(parse_object(R"({ "decode": { "maxDepth": 0 } })")); }, "decode.maxDepth must be larger than 0");
            expect_throws_msg([] { codec_config::from_json(parse_object(R"({ "encode": { "initialCapacity": 100 } })")); },
                "encode.initialCapacity: 100 must be larger than encode.safeMargin: 100");
        };
        "from_file"_test = [] {
            const auto path = write_tmp_config("icarus-config-test.json", R"({ "encode": { "initialCapacity": 4096, "safeMargin": 16 } })");
            const auto cfg = codec_config::from_file(path);
            test_same(size_t { 4096 }, cfg.encode.initial_capacity);
            test_same(size_t { 16 }, cfg.encode.safe_margin);
            std::filesystem::remove(path);
        };
        "from_file errors"_test = [] {
            expect_throws_msg([] { codec_config::from_file("./icarus-config-missing.json"); }, "failed to open ./icarus-config-missing.json for reading");
            const auto path = write_tmp_config("icarus-config-invalid.json", R"({ "encode": { "safeMargin": "a" } })");
            expect_throws_msg([&] { codec_config::from_file(path); }, fmt::format("invalid config file {}", path));
            std::filesystem::remove(path);
        };
        "from_env"_test = [] {
            my_setenv("ICARUS_CONFIG", nullptr);
            test_same(size_t { 1024 }, codec_config::from_env().decode.max_depth);
            const auto path = write_tmp_config("icarus-config-env.json", R"({ "decode": { "maxDepth": 7 } })");
            my_setenv("ICARUS_CONFIG", path.c_str());
            test_same(size_t { 7 }, codec_config::from_env().decode.max_depth);
            my_setenv("ICARUS_CONFIG", nullptr);
            std::filesystem::remove(path);
        };
    };
};
