/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_COMMON_TEST_HPP
#define ICARUS_COMMON_TEST_HPP

#include <iostream>
#include <optional>
#include <source_location>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"
#include "error.hpp"
#include "format.hpp"

namespace icarus {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>) {
                std::cerr << fmt::format("{}", t);
            } else {
                std::cerr << std::forward<T>(t);
            }
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename T>
    bool test_same(const T &x, const T &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename X, typename Y>
    bool test_same(const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<X>(y);
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    // checks that f throws an exception of type E whose message starts with the given prefix
    template<typename E=error, typename F>
    void expect_throws_msg(const F &f, const std::string_view prefix, const std::source_location &loc=std::source_location::current())
    {
        std::optional<std::string> msg {};
        try {
            f();
        } catch (const E &ex) {
            msg = ex.what();
        }
        expect(static_cast<bool>(msg), loc) << "no exception has been thrown";
        if (msg)
            expect(msg->starts_with(prefix), loc) << fmt::format("'{}' does not start with '{}'", *msg, prefix);
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<icarus::test_printer>> {};

#endif // !ICARUS_COMMON_TEST_HPP
