// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "ghafs/core/catalog_client.hpp"
#include "ghafs/core/logging.hpp"
#include "ghafs/util/url_manip.hpp"

namespace ghafs
{
    CatalogClient::CatalogClient(
        download::RemoteFetchParams params,
        std::optional<specs::BasicHTTPAuthentication> authentication,
        std::unique_ptr<download::Transport> transport
    )
        : m_params(std::move(params))
        , m_authentication(std::move(authentication))
        , p_transport(std::move(transport))
    {
        if (!p_transport)
        {
            throw ghafs_error("Catalog client requires a transport", ghafs_error_code::internal_failure);
        }
        if (m_authentication.has_value())
        {
            logging::register_secret(m_authentication->password);
        }
    }

    auto CatalogClient::catalog_endpoint(std::string_view owner, std::string_view repo)
        -> std::string
    {
        return fmt::format(
            "repos/{}/{}/releases",
            util::encode_path_segment(owner),
            util::encode_path_segment(repo)
        );
    }

    auto CatalogClient::endpoint_url(std::string_view endpoint) const -> std::string
    {
        return util::url_concat(m_params.api_url, endpoint);
    }

    auto CatalogClient::fetch_catalog(std::string_view owner, std::string_view repo)
        -> expected_t<specs::Catalog>
    {
        const auto endpoint = catalog_endpoint(owner, repo);
        auto content = cached_get(endpoint);
        if (!content)
        {
            return forward_error(content);
        }

        if (!content->is_array())
        {
            return make_unexpected(
                fmt::format("Releases of '{}/{}' are not a JSON array", owner, repo),
                ghafs_error_code::decode_error
            );
        }

        try
        {
            auto catalog = content->get<specs::Catalog>();
            LOG_DEBUG << "Catalog of '" << owner << "/" << repo << "' has " << catalog.size()
                      << " releases";
            return catalog;
        }
        catch (const nlohmann::json::exception& e)
        {
            return make_unexpected(
                fmt::format("Could not decode releases of '{}/{}': {}", owner, repo, e.what()),
                ghafs_error_code::decode_error
            );
        }
    }

    // Be careful with: https://docs.github.com/en/rest/using-the-rest-api/rate-limits-for-the-rest-api
    // Also see: https://docs.github.com/en/rest/using-the-rest-api/best-practices-for-using-the-rest-api#use-conditional-requests-if-appropriate
    auto CatalogClient::cached_get(const std::string& endpoint) -> expected_t<nlohmann::json>
    {
        auto request = download::Request(endpoint_url(endpoint));
        request.authentication = m_authentication;

        // The body served on "304" is the one matching the validator that was sent,
        // even if another fetch replaced the entry in the meantime.
        const std::optional<EtagCacheEntry> previous = cache_entry(endpoint);
        if (previous.has_value())
        {
            request.etag = previous->etag;
        }

        auto result = p_transport->fetch(request);
        if (!result)
        {
            auto message = fmt::format("Could not fetch '{}': {}", request.url, result.error().message);
            if (result.error().transfer.has_value())
            {
                return make_unexpected(
                    message,
                    ghafs_error_code::transport_error,
                    result.error().transfer.value()
                );
            }
            return make_unexpected(message, ghafs_error_code::transport_error);
        }

        const download::Success& success = result.value();
        switch (success.transfer.http_status)
        {
            case download::http::OK:
            {
                auto content = nlohmann::json::parse(success.body, nullptr, /* allow_exceptions */ false);
                if (content.is_discarded())
                {
                    return make_unexpected(
                        fmt::format("Response of '{}' is not valid JSON", request.url),
                        ghafs_error_code::decode_error
                    );
                }

                if (!success.etag.empty())
                {
                    m_etags->insert_or_assign(endpoint, EtagCacheEntry{ success.etag, content });
                    LOG_DEBUG << "Cached '" << endpoint << "' with ETag " << success.etag;
                }
                return content;
            }
            case download::http::NOT_MODIFIED:
            {
                if (!previous.has_value())
                {
                    return make_unexpected(
                        fmt::format(
                            "Server reported '{}' as not modified but nothing is cached for it",
                            endpoint
                        ),
                        ghafs_error_code::cache_consistency
                    );
                }
                LOG_INFO << "Cache is still valid for '" << endpoint << "'";
                return previous->content;
            }
            default:
            {
                return make_unexpected(
                    fmt::format(
                        "Unable to retrieve releases (response: {}) for '{}'",
                        success.transfer.http_status,
                        request.url
                    ),
                    ghafs_error_code::transport_error,
                    success.transfer
                );
            }
        }
    }

    auto CatalogClient::cache_entry(std::string_view endpoint) const
        -> std::optional<EtagCacheEntry>
    {
        auto etags = m_etags.synchronize();
        if (auto it = etags->find(endpoint); it != etags->end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    auto CatalogClient::cache_size() const -> std::size_t
    {
        return m_etags->size();
    }

    auto CatalogClient::params() const -> const download::RemoteFetchParams&
    {
        return m_params;
    }
}
