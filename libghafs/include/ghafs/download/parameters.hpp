// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_DOWNLOAD_PARAMETERS_HPP
#define GHAFS_DOWNLOAD_PARAMETERS_HPP

#include <optional>
#include <string>

namespace ghafs::download
{
    struct RemoteFetchParams
    {
        // Root of the releases API, the catalog endpoint is appended to it.
        std::string api_url = "https://api.github.com";

        // ssl_verify can be either an empty string (regular SSL verification),
        // the string "<false>" to indicate no SSL verification, or a path to
        // a cert file.
        std::string ssl_verify = "";

        std::string user_agent = "ghafs";

        double connect_timeout_secs = 10.;
        // Zero means no limit on the whole transfer.
        long transfer_timeout_secs = 60;

        std::optional<std::string> proxy = std::nullopt;
    };
}
#endif
