// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_CORE_CONFIGURATION_HPP
#define GHAFS_CORE_CONFIGURATION_HPP

#include <filesystem>
#include <string_view>

#include "ghafs/core/context.hpp"
#include "ghafs/core/error_handling.hpp"

namespace ghafs
{
    /**
     * Apply the values of a YAML configuration file to the context.
     *
     * Recognized keys:
     *  - ``api_url``, ``user_agent``, ``ssl_verify``, ``proxy`` (strings)
     *  - ``connect_timeout_secs`` (number), ``transfer_timeout_secs`` (integer)
     *  - ``username``, ``password`` (strings)
     *  - ``log_level`` (trace, debug, info, warning, error, critical, off)
     *  - ``refresh`` (never, root-listing)
     *  - ``ttl_secs`` (number)
     *
     * Unknown keys are reported with a warning and ignored. A key set to an invalid value
     * fails with `ghafs_error_code::configuration_error` and leaves the context untouched.
     */
    auto load_rc_file(const std::filesystem::path& file, Context& ctx) -> expected_t<void>;

    /** Same as `load_rc_file` from YAML text, `source` names it in messages. */
    auto load_rc_string(std::string_view yaml, Context& ctx, std::string_view source = "<string>")
        -> expected_t<void>;
}

#endif
