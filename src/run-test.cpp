/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <iostream>
#include <icarus/common/test.hpp>
#include <icarus/logger.hpp>

int main(const int argc, const char **argv)
{
    using namespace icarus;
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool failed = boost::ut::cfg<boost::ut::override>.run();
    logger::info("run-test finished with {}", failed ? "failures" : "success");
    return failed ? 1 : 0;
}
