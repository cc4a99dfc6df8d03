/* This file is part of Icarus CBOR project.
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ICARUS_JSON_HPP
#define ICARUS_JSON_HPP

#include <fstream>
#include <iterator>
#include <string>
#include <boost/json.hpp>
#include <icarus/common/bytes.hpp>
#include <icarus/common/error.hpp>

namespace icarus::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(static_cast<std::string_view>(buf), sp);
    }

    inline std::string read_file(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open {} for reading", path));
        std::string data { std::istreambuf_iterator<char> { is }, std::istreambuf_iterator<char> {} };
        if (is.bad())
            throw error_sys(fmt::format("failed to read {}", path));
        return data;
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(buffer { read_file(path) }, sp);
    }
}

#endif // !ICARUS_JSON_HPP
