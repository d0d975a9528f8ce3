// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_UTIL_URL_MANIP_HPP
#define GHAFS_UTIL_URL_MANIP_HPP

#include <string>
#include <string_view>

namespace ghafs::util
{
    /**
     * Join URL parts with exactly one '/' between them.
     *
     * Empty parts are skipped, so ``url_concat("https://api.github.com/", "/repos")``
     * gives ``"https://api.github.com/repos"``.
     */
    template <typename... Args>
    [[nodiscard]] auto url_concat(const Args&... args) -> std::string;

    /**
     * Percent-encode a single URL path segment.
     *
     * Unreserved characters (RFC 3986) are kept as they are.
     */
    [[nodiscard]] auto encode_path_segment(std::string_view segment) -> std::string;

    /**
     * Remove the user information (``user:password@``) of a URL, if any.
     */
    [[nodiscard]] auto hide_url_credentials(std::string_view url) -> std::string;

    /********************
     *  Implementation  *
     ********************/

    namespace detail
    {
        void url_join_two(std::string& out, std::string_view to_add);
    }

    template <typename... Args>
    auto url_concat(const Args&... args) -> std::string
    {
        std::string result;
        result.reserve((std::string_view(args).size() + ... + 1));
        (detail::url_join_two(result, std::string_view(args)), ...);
        return result;
    }
}
#endif
