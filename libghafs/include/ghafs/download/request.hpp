// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_DOWNLOAD_REQUEST_HPP
#define GHAFS_DOWNLOAD_REQUEST_HPP

#include <optional>
#include <string>

#include <tl/expected.hpp>

#include "ghafs/specs/authentication_info.hpp"

namespace ghafs::download
{
    namespace http
    {
        inline constexpr int OK = 200;
        inline constexpr int NOT_MODIFIED = 304;
    }

    /*******************************
     * Download results structures *
     *******************************/

    struct TransferData
    {
        int http_status = 0;
        std::string effective_url = "";
        std::size_t downloaded_size = 0;
    };

    struct Success
    {
        TransferData transfer = {};
        std::string etag = "";
        std::string body = "";
    };

    struct Error
    {
        std::string message = "";
        std::optional<TransferData> transfer = std::nullopt;
    };

    using Result = tl::expected<Success, Error>;

    /*******************************
     * Download request structures *
     *******************************/

    struct Request
    {
        std::string url;
        // Sent as `If-None-Match` when set.
        std::optional<std::string> etag = std::nullopt;
        std::optional<specs::BasicHTTPAuthentication> authentication = std::nullopt;

        explicit Request(std::string lurl);
    };
}

#endif
