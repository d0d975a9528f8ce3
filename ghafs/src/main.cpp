// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <memory>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "ghafs/core/context.hpp"
#include "ghafs/core/error_handling.hpp"
#include "ghafs/core/logging.hpp"
#include "ghafs/download/transport.hpp"
#include "ghafs/version.hpp"
#include "ghafs/vfs/fuse_host.hpp"
#include "ghafs/vfs/release_filesystem.hpp"

#include "common_options.hpp"

using namespace ghafs;  // NOLINT(build/namespaces)

namespace
{
    void mount(const Context& ctx)
    {
        download::CurlGlobalInit curl_init;

        auto filesystem = vfs::ReleaseFilesystem::from_context(
            ctx,
            std::make_unique<download::CurlTransport>(ctx.remote_fetch_params)
        );
        // Nothing is mounted when the initial catalog cannot be fetched.
        extract(filesystem->load());

        vfs::FuseHost host{ *filesystem, ctx.mount_params };
        extract(host.run());
    }
}

int
main(int argc, char** argv)
{
    CLI::App app{ "Mount the releases of a GitHub repository as a read-only filesystem.\n"
                  "Version: "
                  + version() + "\n" };
    app.set_version_flag("--version", version());

    CommandLineOptions options;
    init_mount_options(&app, options);
    init_network_options(&app, options);
    init_general_options(&app, options);

    CLI11_PARSE(app, argc, argv);

    logging::set_logging_params(LoggingParams{});

    std::optional<std::string> error_to_report;
    try
    {
        const auto ctx = extract(make_context(options));
        logging::set_logging_params(ctx.logging_params);
        LOG_DEBUG << "ghafs " << version() << " mounting " << ctx.mount_params.owner << '/'
                  << ctx.mount_params.repo << " (refresh: " << name_of(ctx.mount_params.refresh)
                  << ")";
        mount(ctx);
    }
    catch (const ghafs_error& e)
    {
        error_to_report = std::string(e.what()) + " (" + std::string(name_of(e.error_code())) + ")";
    }
    catch (const std::exception& e)
    {
        error_to_report = e.what();
    }

    if (error_to_report)
    {
        LOG_CRITICAL << error_to_report.value();
        return 1;
    }
    return 0;
}
