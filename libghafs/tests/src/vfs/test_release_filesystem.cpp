// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "ghafs/core/logging.hpp"
#include "ghafs/vfs/release_filesystem.hpp"

#include "ghafstests.hpp"

using namespace ghafs;
using namespace ghafs::vfs;

namespace
{
    struct FilesystemFixture
    {
        explicit FilesystemFixture(RefreshPolicy policy)
        {
            auto fake = std::make_unique<ghafstests::FakeTransport>();
            transport = fake.get();
            auto client = std::make_unique<CatalogClient>(
                download::RemoteFetchParams(),
                std::nullopt,
                std::move(fake)
            );
            filesystem = std::make_unique<ReleaseFilesystem>(std::move(client), "octo", "app", policy);
        }

        auto tag_names() -> std::vector<std::string>
        {
            auto names = std::vector<std::string>();
            for (const auto& tag : filesystem->responder().snapshot()->tags())
            {
                names.push_back(tag.name);
            }
            return names;
        }

        ghafstests::FakeTransport* transport = nullptr;
        std::unique_ptr<ReleaseFilesystem> filesystem;
    };

    /** Copies the records of the "ghafs" logger, one "level message" per line. */
    class LogCapture
    {
    public:

        LogCapture()
            : m_previous(logging::set_log_level(log_level::warn))
            , m_logger(spdlog::get("ghafs"))
            , m_sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(m_out))
        {
            m_sink->set_pattern("%l %v");
            m_logger->sinks().push_back(m_sink);
        }

        ~LogCapture()
        {
            auto& sinks = m_logger->sinks();
            sinks.erase(std::remove(sinks.begin(), sinks.end(), m_sink), sinks.end());
            logging::set_log_level(m_previous);
        }

        auto lines() const -> std::vector<std::string>
        {
            auto result = std::vector<std::string>();
            auto in = std::istringstream(m_out.str());
            for (std::string line; std::getline(in, line);)
            {
                result.push_back(line);
            }
            return result;
        }

    private:

        std::ostringstream m_out;
        log_level m_previous;
        std::shared_ptr<spdlog::logger> m_logger;
        std::shared_ptr<spdlog::sinks::ostream_sink_mt> m_sink;
    };

    TEST_CASE("ReleaseFilesystem load")
    {
        auto fixture = FilesystemFixture(RefreshPolicy::never);
        REQUIRE(fixture.filesystem->owner() == "octo");
        REQUIRE(fixture.filesystem->repo() == "app");
        REQUIRE(fixture.filesystem->policy() == RefreshPolicy::never);

        // Nothing but the root before the first load
        REQUIRE(fixture.tag_names().empty());

        fixture.transport->push_response(200, ghafstests::single_release_body, "\"abc\"");
        REQUIRE(fixture.filesystem->load().has_value());
        REQUIRE(fixture.tag_names() == std::vector<std::string>{ "v1.0" });
        REQUIRE(
            fixture.transport->requests().front().url
            == "https://api.github.com/repos/octo/app/releases"
        );

        const auto tag = fixture.filesystem->lookup(root_id, "v1.0");
        REQUIRE(tag.has_value());
        const auto file = fixture.filesystem->lookup(tag->id, "app.bin");
        REQUIRE(file.has_value());
        REQUIRE(fixture.filesystem->attributes_of(file->id) == file_attributes(file->id));
        REQUIRE(fixture.filesystem->read(file->id, 0) == placeholder_content(file->id));
    }

    TEST_CASE("ReleaseFilesystem load failure")
    {
        auto fixture = FilesystemFixture(RefreshPolicy::never);
        fixture.transport->push_response(401, R"({"message": "Bad credentials"})");

        const auto res = fixture.filesystem->load();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().error_code() == ghafs_error_code::transport_error);
        REQUIRE(fixture.tag_names().empty());
    }

    TEST_CASE("ReleaseFilesystem never refreshes")
    {
        auto fixture = FilesystemFixture(RefreshPolicy::never);
        fixture.transport->push_response(200, ghafstests::single_release_body, "\"abc\"");
        REQUIRE(fixture.filesystem->load().has_value());

        fixture.transport->push_response(200, ghafstests::two_releases_body, "\"def\"");
        const auto listing = fixture.filesystem->list_directory(root_id, 0);
        REQUIRE(listing.has_value());
        REQUIRE(listing->size() == 3);
        REQUIRE(fixture.transport->requests().size() == 1);
        REQUIRE(fixture.transport->pending() == 1);
    }

    TEST_CASE("ReleaseFilesystem refreshes on root listing")
    {
        auto fixture = FilesystemFixture(RefreshPolicy::root_listing);
        fixture.transport->push_response(200, ghafstests::single_release_body, "\"abc\"");
        REQUIRE(fixture.filesystem->load().has_value());

        SECTION("Catalog changed")
        {
            fixture.transport->push_response(200, ghafstests::two_releases_body, "\"def\"");
            const auto listing = fixture.filesystem->list_directory(root_id, 0);
            REQUIRE(listing.has_value());
            REQUIRE(listing->size() == 4);
            REQUIRE(fixture.tag_names() == std::vector<std::string>{ "v2.0", "v1.0" });
            REQUIRE(fixture.transport->requests().back().etag == "\"abc\"");
        }

        SECTION("Catalog unchanged")
        {
            fixture.transport->push_response(304, "", "\"abc\"");
            const auto listing = fixture.filesystem->list_directory(root_id, 0);
            REQUIRE(listing.has_value());
            REQUIRE(listing->size() == 3);
            REQUIRE(fixture.tag_names() == std::vector<std::string>{ "v1.0" });
            REQUIRE(fixture.transport->requests().size() == 2);
        }

        SECTION("Refresh failure keeps the previous tree")
        {
            fixture.transport->push_network_error("Connection refused");
            const auto before = fixture.filesystem->responder().snapshot();
            const auto listing = fixture.filesystem->list_directory(root_id, 0);
            REQUIRE(listing.has_value());
            REQUIRE(listing->size() == 3);
            REQUIRE(fixture.filesystem->responder().snapshot() == before);
        }

        SECTION("Only the first page of the root triggers a refresh")
        {
            REQUIRE(fixture.filesystem->list_directory(root_id, 2).has_value());
            const inode_t tag = fixture.filesystem->lookup(root_id, "v1.0")->id;
            REQUIRE(fixture.filesystem->list_directory(tag, 0).has_value());
            REQUIRE(fixture.transport->requests().size() == 1);
        }
    }

    TEST_CASE("ReleaseFilesystem refresh failures are logged once")
    {
        auto fixture = FilesystemFixture(RefreshPolicy::root_listing);
        // No validator, nothing is cached
        fixture.transport->push_response(200, ghafstests::single_release_body);
        REQUIRE(fixture.filesystem->load().has_value());
        const auto before = fixture.filesystem->responder().snapshot();

        SECTION("Inconsistent cache")
        {
            fixture.transport->push_response(304, "");
            auto capture = LogCapture();
            const auto listing = fixture.filesystem->list_directory(root_id, 0);
            REQUIRE(listing.has_value());
            REQUIRE(listing->size() == 3);
            REQUIRE(fixture.filesystem->responder().snapshot() == before);

            const auto lines = capture.lines();
            REQUIRE(lines.size() == 1);
            REQUIRE(lines.front().starts_with("error "));
            REQUIRE(lines.front().find("nothing is cached") != std::string::npos);
        }

        SECTION("Network error")
        {
            fixture.transport->push_network_error("Connection refused");
            auto capture = LogCapture();
            REQUIRE(fixture.filesystem->list_directory(root_id, 0).has_value());
            REQUIRE(fixture.filesystem->responder().snapshot() == before);

            const auto lines = capture.lines();
            REQUIRE(lines.size() == 1);
            REQUIRE(lines.front().starts_with("warning "));
            REQUIRE(lines.front().find("Connection refused") != std::string::npos);
        }
    }

    TEST_CASE("ReleaseFilesystem from_context")
    {
        auto ctx = Context();
        ctx.remote_fetch_params.api_url = "http://localhost:9999";
        ctx.mount_params.owner = "octo-org";
        ctx.mount_params.repo = "hello";
        ctx.mount_params.refresh = RefreshPolicy::root_listing;
        ctx.username = "user";
        ctx.password = "pass";

        auto fake = std::make_unique<ghafstests::FakeTransport>();
        auto* transport = fake.get();
        transport->push_response(200, "[]");

        auto filesystem = ReleaseFilesystem::from_context(ctx, std::move(fake));
        REQUIRE(filesystem->owner() == "octo-org");
        REQUIRE(filesystem->repo() == "hello");
        REQUIRE(filesystem->policy() == RefreshPolicy::root_listing);
        REQUIRE(filesystem->client().params().api_url == "http://localhost:9999");

        REQUIRE(filesystem->load().has_value());
        const auto& request = transport->requests().front();
        REQUIRE(request.url == "http://localhost:9999/repos/octo-org/hello/releases");
        REQUIRE(request.authentication == specs::BasicHTTPAuthentication{ "user", "pass" });
        logging::clear_secrets();
    }

    TEST_CASE("ReleaseFilesystem requires a client")
    {
        REQUIRE_THROWS_AS(ReleaseFilesystem(nullptr, "o", "r"), ghafs_error);
    }
}
