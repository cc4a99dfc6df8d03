/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_COMMON_ERROR_HPP
#define ICARUS_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace icarus {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}

#endif // !ICARUS_COMMON_ERROR_HPP
