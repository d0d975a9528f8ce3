// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <tuple>

#include "ghafs/specs/authentication_info.hpp"

namespace ghafs::specs
{
    namespace
    {
        auto attrs(const BasicHTTPAuthentication& auth)
        {
            return std::tie(auth.user, auth.password);
        }
    }

    auto operator==(const BasicHTTPAuthentication& a, const BasicHTTPAuthentication& b) -> bool
    {
        return attrs(a) == attrs(b);
    }

    auto operator!=(const BasicHTTPAuthentication& a, const BasicHTTPAuthentication& b) -> bool
    {
        return !(a == b);
    }

    auto make_basic_authentication(
        const std::optional<std::string>& user,
        const std::optional<std::string>& password
    ) -> std::optional<BasicHTTPAuthentication>
    {
        if (user.has_value() && password.has_value() && !user->empty() && !password->empty())
        {
            return BasicHTTPAuthentication{ *user, *password };
        }
        return std::nullopt;
    }
}
