// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cctype>

#include <fmt/format.h>

#include "ghafs/util/url_manip.hpp"

namespace ghafs::util
{
    namespace detail
    {
        void url_join_two(std::string& out, std::string_view to_add)
        {
            if (to_add.empty())
            {
                return;
            }
            if (!out.empty())
            {
                const bool out_has_slash = out.back() == '/';
                const bool to_add_has_slash = to_add.front() == '/';
                if (out_has_slash && to_add_has_slash)
                {
                    to_add = to_add.substr(1);
                }
                if (!out_has_slash && !to_add_has_slash)
                {
                    out += '/';
                }
            }
            out += to_add;
        }
    }

    auto encode_path_segment(std::string_view segment) -> std::string
    {
        std::string out;
        out.reserve(segment.size());
        for (const char c : segment)
        {
            const auto uc = static_cast<unsigned char>(c);
            if (std::isalnum(uc) || c == '-' || c == '.' || c == '_' || c == '~')
            {
                out += c;
            }
            else
            {
                out += fmt::format("%{:02X}", uc);
            }
        }
        return out;
    }

    auto hide_url_credentials(std::string_view url) -> std::string
    {
        const auto scheme_end = url.find("://");
        const auto authority_start = (scheme_end == std::string_view::npos) ? 0 : scheme_end + 3;
        const auto authority_end = url.find('/', authority_start);
        const auto authority = url.substr(
            authority_start,
            (authority_end == std::string_view::npos) ? std::string_view::npos
                                                      : authority_end - authority_start
        );
        const auto at = authority.rfind('@');
        if (at == std::string_view::npos)
        {
            return std::string(url);
        }
        return fmt::format(
            "{}*****@{}",
            url.substr(0, authority_start),
            url.substr(authority_start + at + 1)
        );
    }
}
