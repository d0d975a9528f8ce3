// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>
#include <iterator>

#include "ghafs/util/string.hpp"

namespace ghafs::util
{
    auto to_lower(char c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto to_lower(std::string_view str) -> std::string
    {
        auto out = std::string();
        out.reserve(str.size());
        std::transform(
            str.cbegin(),
            str.cend(),
            std::back_inserter(out),
            [](char c) { return to_lower(c); }
        );
        return out;
    }

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    auto strip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const auto start = input.find_first_not_of(chars);
        if (start == std::string_view::npos)
        {
            return {};
        }
        const auto end = input.find_last_not_of(chars);
        return input.substr(start, end - start + 1);
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return strip(input, ascii_whitespaces());
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        const auto end = input.find_last_not_of(ascii_whitespaces());
        return end == std::string_view::npos ? std::string_view() : input.substr(0, end + 1);
    }

    auto split_once(std::string_view str, char sep) -> std::array<std::string_view, 2>
    {
        const auto pos = str.find(sep);
        if (pos == std::string_view::npos)
        {
            return { str, std::string_view() };
        }
        return { str.substr(0, pos), str.substr(pos + 1) };
    }

    void replace_all(std::string& data, std::string_view search, std::string_view replace)
    {
        if (search.empty())
        {
            return;
        }
        std::size_t pos = data.find(search);
        while (pos != std::string::npos)
        {
            data.replace(pos, search.size(), replace);
            pos += replace.size();
            pos = data.find(search, pos);
        }
    }
}
