// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdlib>
#include <filesystem>
#include <map>

#include "ghafs/core/configuration.hpp"
#include "ghafs/core/logging.hpp"

#include "common_options.hpp"

using namespace ghafs;  // NOLINT(build/namespaces)

void
init_mount_options(CLI::App* app, CommandLineOptions& options)
{
    app->add_option("MOUNT_PATH", options.mount_point, "Directory to mount the releases on")
        ->required()
        ->check(CLI::ExistingDirectory);
    app->add_option("OWNER", options.owner, "Owner of the repository")->required();
    app->add_option("REPO", options.repo, "Name of the repository")->required();

    std::string cli_group = "Mount options";

    std::map<std::string, RefreshPolicy> refresh_map = {
        { "never", RefreshPolicy::never },
        { "root-listing", RefreshPolicy::root_listing },
    };
    app->add_option("--refresh", options.refresh, "When to fetch the releases again")
        ->transform(CLI::CheckedTransformer(refresh_map, CLI::ignore_case))
        ->group(cli_group);

    app->add_flag("--fuse-debug", options.fuse_debug, "Enable libfuse debug output")->group(cli_group);
}

void
init_network_options(CLI::App* app, CommandLineOptions& options)
{
    std::string cli_group = "Network options";

    app->add_option("-u,--username", options.username, "User for basic authentication")
        ->option_text("USER")
        ->group(cli_group);
    app->add_option("-p,--password", options.password, "Password or token for basic authentication")
        ->option_text("PASSWORD")
        ->group(cli_group);
    app->add_option("--api-url", options.api_url, "Root URL of the releases API")
        ->option_text("URL")
        ->group(cli_group);
}

void
init_general_options(CLI::App* app, CommandLineOptions& options)
{
    std::string cli_group = "Global options";

    app->add_option("--rc-file", options.rc_file, "Configuration file to use instead of ~/.ghafsrc")
        ->option_text("FILE")
        ->check(CLI::ExistingFile)
        ->group(cli_group);

    app->add_flag(
           "-v,--verbose",
           options.verbose,
           "Set verbosity (higher verbosity with multiple -v, e.g. -vvv)"
    )
        ->multi_option_policy(CLI::MultiOptionPolicy::Sum)
        ->group(cli_group);

    std::map<std::string, ghafs::log_level> le_map = { { "critical", ghafs::log_level::critical },
                                                       { "error", ghafs::log_level::err },
                                                       { "warning", ghafs::log_level::warn },
                                                       { "info", ghafs::log_level::info },
                                                       { "debug", ghafs::log_level::debug },
                                                       { "trace", ghafs::log_level::trace },
                                                       { "off", ghafs::log_level::off } };
    app->add_option("--log-level", options.log_level, "Set the log level")
        ->group(cli_group)
        ->transform(CLI::CheckedTransformer(le_map, CLI::ignore_case));
}

namespace
{
    auto default_rc_file() -> std::optional<std::filesystem::path>
    {
        const char* home = std::getenv("HOME");
        if (home == nullptr)
        {
            return std::nullopt;
        }
        auto path = std::filesystem::path(home) / ".ghafsrc";
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            return std::nullopt;
        }
        return path;
    }
}

auto
make_context(const CommandLineOptions& options) -> expected_t<Context>
{
    Context ctx;

    const auto rc_file = options.rc_file ? std::optional<std::filesystem::path>(*options.rc_file)
                                         : default_rc_file();
    if (rc_file)
    {
        if (auto res = load_rc_file(*rc_file, ctx); !res)
        {
            return forward_error(res);
        }
    }

    ctx.mount_params.mount_point = options.mount_point;
    ctx.mount_params.owner = options.owner;
    ctx.mount_params.repo = options.repo;
    ctx.mount_params.fuse_debug = options.fuse_debug;
    if (options.refresh)
    {
        ctx.mount_params.refresh = *options.refresh;
    }
    if (options.api_url)
    {
        ctx.remote_fetch_params.api_url = *options.api_url;
    }
    if (options.username)
    {
        ctx.username = options.username;
    }
    if (options.password)
    {
        ctx.password = options.password;
        logging::register_secret(*options.password);
    }
    if (options.log_level)
    {
        ctx.logging_params.logging_level = *options.log_level;
    }
    ctx.set_verbosity(options.verbose);

    if (ctx.username.has_value() != ctx.password.has_value())
    {
        LOG_WARNING << "Basic authentication needs both a user and a password, ignoring credentials";
    }
    return ctx;
}
