/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include <string>
#include <icarus/common/bytes.hpp>
#include <icarus/common/error.hpp>
#include <icarus/common/test.hpp>
#include <icarus/cbor/error.hpp>
#include <icarus/logger.hpp>

using namespace icarus;

static std::string no_error_msg {
#ifdef __APPLE__
    "Undefined error: 0"
#elif _WIN32
    "No error"
#else
    "Success"
#endif
};

suite error_suite = [] {
    "error"_test = [] {
        "no_args"_test = [] {
            expect_throws_msg([] { throw error("Hello!"); }, "Hello!");
        };
        "integers"_test = [] {
            expect_throws_msg([] { throw error(fmt::format("Hello {}!", 123)); }, "Hello 123!");
        };
        "buffer"_test = [] {
            const uint8_vector buf { 0xDE, 0xAD, 0xBE, 0xEF };
            expect_throws_msg([&] { throw error(fmt::format("Hello {}!", buf)); }, "Hello DEADBEEF!");
        };
        "cause"_test = [] {
            expect_throws_msg([] {
                try {
                    throw error("inner");
                } catch (const std::exception &ex) {
                    throw error("outer", ex);
                }
            }, "outer caused by ");
        };
        "codec errors are errors"_test = [] {
            expect_throws_msg([] { throw cbor::decoding_error("bad input"); }, "bad input");
            expect_throws_msg<cbor::encoding_error>([] { throw cbor::encoding_error("bad value"); }, "bad value");
            expect(throws<cbor::decoding_error>([] { throw cbor::decoding_error("bad input"); }));
        };
        "stacktrace logging follows the tracing switch"_test = [] {
            auto &tracing = logger::tracing_enabled();
            const auto prev = tracing;
            for (const bool enabled: { false, true }) {
                tracing = enabled;
                const error err { "traced failure" };
                test_same(std::string_view { "traced failure" }, std::string_view { err.what() });
            }
            tracing = prev;
        };
        "error_sys_ok"_test = [] {
            expect_throws_msg([] { errno = 0; throw error_sys(fmt::format("Hello {}!", "world")); }, "Hello world! errno: 0 strerror: " + no_error_msg);
        };
        "error_sys_fail"_test = [] {
            expect_throws_msg([] { errno = 2; throw error_sys(fmt::format("Hello {}!", "world")); }, "Hello world! errno: 2 strerror: No such file or directory");
        };
    };
};
