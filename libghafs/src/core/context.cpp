// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "ghafs/core/context.hpp"
#include "ghafs/util/string.hpp"

namespace ghafs
{
    auto name_of(RefreshPolicy policy) noexcept -> std::string_view
    {
        switch (policy)
        {
            case RefreshPolicy::root_listing:
                return "root-listing";
            default:
                return "never";
        }
    }

    auto refresh_policy_from_name(std::string_view name) -> std::optional<RefreshPolicy>
    {
        const auto lname = util::to_lower(util::strip(name));
        if (lname == "never")
        {
            return RefreshPolicy::never;
        }
        if (lname == "root-listing" || lname == "root_listing")
        {
            return RefreshPolicy::root_listing;
        }
        return std::nullopt;
    }

    auto Context::authentication_info() const -> std::optional<specs::BasicHTTPAuthentication>
    {
        return specs::make_basic_authentication(username, password);
    }

    void Context::set_verbosity(int lvl)
    {
        switch (lvl)
        {
            case 0:
                break;
            case 1:
                logging_params.logging_level = log_level::info;
                break;
            case 2:
                logging_params.logging_level = log_level::debug;
                break;
            default:
                logging_params.logging_level = log_level::trace;
                break;
        }
    }
}
