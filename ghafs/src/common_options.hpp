// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_COMMON_OPTIONS_HPP
#define GHAFS_COMMON_OPTIONS_HPP

#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "ghafs/core/context.hpp"
#include "ghafs/core/error_handling.hpp"

struct CommandLineOptions
{
    std::string mount_point;
    std::string owner;
    std::string repo;

    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> api_url;
    std::optional<std::string> rc_file;
    std::optional<ghafs::log_level> log_level;
    std::optional<ghafs::RefreshPolicy> refresh;
    int verbose = 0;
    bool fuse_debug = false;
};

void init_mount_options(CLI::App* app, CommandLineOptions& options);

void init_network_options(CLI::App* app, CommandLineOptions& options);

void init_general_options(CLI::App* app, CommandLineOptions& options);

/**
 * Load the configuration file (the given one, or ``~/.ghafsrc`` when it exists) then
 * apply the command line on top of it.
 */
auto make_context(const CommandLineOptions& options) -> ghafs::expected_t<ghafs::Context>;

#endif
