// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_CORE_CONTEXT_HPP
#define GHAFS_CORE_CONTEXT_HPP

#include <optional>
#include <string>
#include <string_view>

#include "ghafs/core/logging.hpp"
#include "ghafs/download/parameters.hpp"
#include "ghafs/specs/authentication_info.hpp"

namespace ghafs
{
    /** When the mounted filesystem fetches the catalog again. */
    enum class RefreshPolicy
    {
        /// Only once, before mounting.
        never,
        /// Also every time the root directory is listed from the beginning.
        root_listing,
    };

    [[nodiscard]] auto name_of(RefreshPolicy policy) noexcept -> std::string_view;
    [[nodiscard]] auto refresh_policy_from_name(std::string_view name) -> std::optional<RefreshPolicy>;

    struct MountParams
    {
        std::string mount_point = "";
        std::string owner = "";
        std::string repo = "";

        RefreshPolicy refresh = RefreshPolicy::never;

        // How long the kernel may cache entries and attributes.
        double ttl_secs = 1.0;

        bool fuse_debug = false;
    };

    /**
     * Everything the filesystem needs, gathered from configuration files and the
     * command line.
     */
    class Context
    {
    public:

        download::RemoteFetchParams remote_fetch_params;
        LoggingParams logging_params;
        MountParams mount_params;

        std::optional<std::string> username = std::nullopt;
        std::optional<std::string> password = std::nullopt;

        /** Basic credentials, only when both user and password are set. */
        [[nodiscard]] auto authentication_info() const
            -> std::optional<specs::BasicHTTPAuthentication>;

        /** Raise the logging level by one step per verbosity level (-v: info, -vv: debug...). */
        void set_verbosity(int lvl);
    };
}

#endif
