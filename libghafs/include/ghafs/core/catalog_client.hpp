// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_CORE_CATALOG_CLIENT_HPP
#define GHAFS_CORE_CATALOG_CLIENT_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "ghafs/core/error_handling.hpp"
#include "ghafs/download/parameters.hpp"
#include "ghafs/download/transport.hpp"
#include "ghafs/specs/authentication_info.hpp"
#include "ghafs/specs/release.hpp"
#include "ghafs/util/synchronized_value.hpp"

namespace ghafs
{
    /**
     * Validator and last decoded body of one API endpoint.
     *
     * Created or replaced only on a fresh (200) response carrying an ``ETag``.
     */
    struct EtagCacheEntry
    {
        std::string etag;
        nlohmann::json content;
    };

    /**
     * Fetches the release catalog of a repository from the releases API.
     *
     * Every endpoint keeps the validator of its last fresh response, so that an unchanged
     * catalog is answered with "304 Not Modified" and served from the cached body.
     * The cache is unbounded and lives as long as the client.
     *
     * Thread-safe: the cache is locked for reads and updates, never during a transfer.
     */
    class CatalogClient
    {
    public:

        using cache_type = std::map<std::string, EtagCacheEntry, std::less<>>;

        CatalogClient(
            download::RemoteFetchParams params,
            std::optional<specs::BasicHTTPAuthentication> authentication,
            std::unique_ptr<download::Transport> transport
        );

        CatalogClient(const CatalogClient&) = delete;
        CatalogClient& operator=(const CatalogClient&) = delete;
        CatalogClient(CatalogClient&&) = delete;
        CatalogClient& operator=(CatalogClient&&) = delete;

        /**
         * Fetch the releases of ``owner/repo``.
         *
         * Fails with `ghafs_error_code::transport_error` on network failures and
         * unexpected HTTP statuses (the `download::TransferData` is attached to the error
         * when a response was received), with `ghafs_error_code::decode_error` when the body
         * is not a JSON array of releases, and with `ghafs_error_code::cache_consistency`
         * when the server answers "304" to a request that carried no validator.
         */
        [[nodiscard]] auto fetch_catalog(std::string_view owner, std::string_view repo)
            -> expected_t<specs::Catalog>;

        /** The API path of the releases of a repository, relative to the API root. */
        [[nodiscard]] static auto catalog_endpoint(std::string_view owner, std::string_view repo)
            -> std::string;

        [[nodiscard]] auto endpoint_url(std::string_view endpoint) const -> std::string;

        [[nodiscard]] auto cache_entry(std::string_view endpoint) const
            -> std::optional<EtagCacheEntry>;

        [[nodiscard]] auto cache_size() const -> std::size_t;

        [[nodiscard]] auto params() const -> const download::RemoteFetchParams&;

    private:

        auto cached_get(const std::string& endpoint) -> expected_t<nlohmann::json>;

        download::RemoteFetchParams m_params;
        std::optional<specs::BasicHTTPAuthentication> m_authentication;
        std::unique_ptr<download::Transport> p_transport;
        util::synchronized_value<cache_type> m_etags;
    };
}

#endif
