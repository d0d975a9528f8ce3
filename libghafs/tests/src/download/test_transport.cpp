// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>

#include <catch2/catch_all.hpp>

#include "ghafs/download/transport.hpp"

#include "ghafstests.hpp"

using namespace ghafs::download;

namespace
{
    TEST_CASE("update_etag")
    {
        std::string etag;

        SECTION("ETag header")
        {
            update_etag("ETag: \"abc\"\r\n", etag);
            REQUIRE(etag == "\"abc\"");

            update_etag("etag:W/\"def\"\r\n", etag);
            REQUIRE(etag == "W/\"def\"");
        }

        SECTION("Other headers")
        {
            update_etag("Content-Type: application/json\r\n", etag);
            update_etag("X-ETag-Like: nope\r\n", etag);
            update_etag("\r\n", etag);
            REQUIRE(etag.empty());
        }

        SECTION("Redirect response does not leak its ETag")
        {
            update_etag("HTTP/1.1 301 Moved Permanently\r\n", etag);
            update_etag("ETag: \"redirect\"\r\n", etag);
            update_etag("Location: https://api.github.com/repositories/1/releases\r\n", etag);
            update_etag("\r\n", etag);
            REQUIRE(etag == "\"redirect\"");

            update_etag("HTTP/2 200\r\n", etag);
            REQUIRE(etag.empty());
            update_etag("content-type: application/json\r\n", etag);
            update_etag("\r\n", etag);
            REQUIRE(etag.empty());
        }

        SECTION("Final response ETag after a redirect")
        {
            update_etag("HTTP/1.1 302 Found\r\n", etag);
            update_etag("ETag: \"redirect\"\r\n", etag);
            update_etag("HTTP/1.1 200 OK\r\n", etag);
            update_etag("ETag: \"final\"\r\n", etag);
            REQUIRE(etag == "\"final\"");
        }
    }

    TEST_CASE("Transport fetch")
    {
        auto transport = ghafstests::FakeTransport();
        transport.push_response(200, "[]", "\"abc\"");

        const auto request = Request("https://api.github.com/repos/octo/app/releases");
        const auto result = transport.fetch(request);
        REQUIRE(result.has_value());
        REQUIRE(result->etag == "\"abc\"");
        REQUIRE(result->transfer.effective_url == request.url);

        const auto failed = transport.fetch(request);
        REQUIRE_FALSE(failed.has_value());
        REQUIRE(transport.requests().size() == 2);
    }
}
