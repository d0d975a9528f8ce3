// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFSTESTS_HPP
#define GHAFSTESTS_HPP

#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ghafs/download/transport.hpp"

namespace ghafstests
{
    /**
     * A transport answering with scripted results, in order, and recording requests.
     *
     * Running out of scripted results gives a network error.
     */
    class FakeTransport final : public ghafs::download::Transport
    {
    public:

        void push_result(ghafs::download::Result result)
        {
            m_results.push_back(std::move(result));
        }

        void push_response(int status, std::string body, std::string etag = "")
        {
            auto success = ghafs::download::Success();
            success.transfer.http_status = status;
            success.transfer.downloaded_size = body.size();
            success.etag = std::move(etag);
            success.body = std::move(body);
            push_result(std::move(success));
        }

        void push_network_error(std::string message)
        {
            push_result(tl::make_unexpected(ghafs::download::Error{ std::move(message), std::nullopt }));
        }

        [[nodiscard]] auto requests() const -> const std::vector<ghafs::download::Request>&
        {
            return m_requests;
        }

        [[nodiscard]] auto pending() const -> std::size_t
        {
            return m_results.size();
        }

    private:

        auto fetch_impl(const ghafs::download::Request& request) -> ghafs::download::Result override
        {
            m_requests.push_back(request);
            if (m_results.empty())
            {
                return tl::make_unexpected(ghafs::download::Error{ "no scripted response", std::nullopt });
            }
            auto result = std::move(m_results.front());
            m_results.pop_front();
            if (result)
            {
                result->transfer.effective_url = request.url;
            }
            return result;
        }

        std::deque<ghafs::download::Result> m_results;
        std::vector<ghafs::download::Request> m_requests;
    };

    /** Releases API body with one release "v1.0" holding "app.bin" and "app.sig". */
    inline constexpr auto single_release_body = R"json([
        {
            "id": 1001,
            "tag_name": "v1.0",
            "url": "https://api.github.com/repos/octo/app/releases/1001",
            "created_at": "2024-01-01T10:00:00Z",
            "published_at": "2024-01-02T10:00:00Z",
            "assets": [
                {
                    "id": 501,
                    "name": "app.bin",
                    "content_type": "application/octet-stream",
                    "size": 10,
                    "url": "https://api.github.com/repos/octo/app/releases/assets/501",
                    "browser_download_url": "https://github.com/octo/app/releases/download/v1.0/app.bin"
                },
                {
                    "id": 502,
                    "name": "app.sig",
                    "content_type": "application/pgp-signature",
                    "size": 5,
                    "url": "https://api.github.com/repos/octo/app/releases/assets/502",
                    "browser_download_url": "https://github.com/octo/app/releases/download/v1.0/app.sig"
                }
            ]
        }
    ])json";

    /** Releases API body with "v2.0" (one asset) then "v1.0" (no asset). */
    inline constexpr auto two_releases_body = R"json([
        {
            "id": 2002,
            "tag_name": "v2.0",
            "created_at": "2024-02-01T10:00:00Z",
            "published_at": null,
            "assets": [ { "id": 601, "name": "tool.tar.gz", "size": 2048 } ]
        },
        {
            "id": 1001,
            "tag_name": "v1.0",
            "created_at": "2024-01-01T10:00:00Z",
            "assets": []
        }
    ])json";
}

#endif
