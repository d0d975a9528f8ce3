// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_UTIL_STRING_HPP
#define GHAFS_UTIL_STRING_HPP

#include <array>
#include <string>
#include <string_view>

namespace ghafs::util
{
    /**
     * Return the common whitespace characters (space, tab, line feed, carriage return...).
     */
    [[nodiscard]] constexpr auto ascii_whitespaces() -> std::string_view
    {
        return " \t\n\v\f\r";
    }

    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;

    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input, std::string_view chars) -> std::string_view;

    /**
     * Split a string around the first occurrence of the separator.
     *
     * If the separator is not found, the first element is the whole input and the second
     * one is empty.
     */
    [[nodiscard]] auto split_once(std::string_view str, char sep)
        -> std::array<std::string_view, 2>;

    void replace_all(std::string& data, std::string_view search, std::string_view replace);
}
#endif
