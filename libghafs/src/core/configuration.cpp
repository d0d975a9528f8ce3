// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "ghafs/core/configuration.hpp"
#include "ghafs/core/logging.hpp"

namespace ghafs
{
    namespace
    {
        auto configuration_error(std::string_view source, std::string_view key, std::string_view what)
        {
            return make_unexpected(
                fmt::format("Invalid configuration value for '{}' in {}: {}", key, source, what),
                ghafs_error_code::configuration_error
            );
        }

        template <typename T>
        auto scalar_as(const YAML::Node& value) -> T
        {
            if (!value.IsScalar())
            {
                throw YAML::BadConversion(value.Mark());
            }
            return value.as<T>();
        }

        auto apply_key(Context& ctx, const std::string& key, const YAML::Node& value, std::string_view source)
            -> expected_t<void>
        {
            if (key == "api_url")
            {
                ctx.remote_fetch_params.api_url = scalar_as<std::string>(value);
            }
            else if (key == "user_agent")
            {
                ctx.remote_fetch_params.user_agent = scalar_as<std::string>(value);
            }
            else if (key == "ssl_verify")
            {
                ctx.remote_fetch_params.ssl_verify = scalar_as<std::string>(value);
            }
            else if (key == "proxy")
            {
                ctx.remote_fetch_params.proxy = scalar_as<std::string>(value);
            }
            else if (key == "connect_timeout_secs")
            {
                ctx.remote_fetch_params.connect_timeout_secs = scalar_as<double>(value);
            }
            else if (key == "transfer_timeout_secs")
            {
                ctx.remote_fetch_params.transfer_timeout_secs = scalar_as<long>(value);
            }
            else if (key == "username")
            {
                ctx.username = scalar_as<std::string>(value);
            }
            else if (key == "password")
            {
                ctx.password = scalar_as<std::string>(value);
                logging::register_secret(*ctx.password);
            }
            else if (key == "log_level")
            {
                const auto name = scalar_as<std::string>(value);
                const auto level = log_level_from_name(name);
                if (!level)
                {
                    return configuration_error(source, key, fmt::format("unknown level '{}'", name));
                }
                ctx.logging_params.logging_level = *level;
            }
            else if (key == "refresh")
            {
                const auto name = scalar_as<std::string>(value);
                const auto policy = refresh_policy_from_name(name);
                if (!policy)
                {
                    return configuration_error(source, key, fmt::format("unknown policy '{}'", name));
                }
                ctx.mount_params.refresh = *policy;
            }
            else if (key == "ttl_secs")
            {
                const auto ttl = scalar_as<double>(value);
                if (ttl < 0)
                {
                    return configuration_error(source, key, "must not be negative");
                }
                ctx.mount_params.ttl_secs = ttl;
            }
            else
            {
                LOG_WARNING << "Unknown configuration key '" << key << "' in " << source;
            }
            return {};
        }
    }

    auto load_rc_string(std::string_view yaml, Context& ctx, std::string_view source)
        -> expected_t<void>
    {
        YAML::Node config;
        try
        {
            config = YAML::Load(std::string(yaml));
        }
        catch (const YAML::Exception& e)
        {
            return make_unexpected(
                fmt::format("Could not parse configuration {}: {}", source, e.what()),
                ghafs_error_code::configuration_error
            );
        }

        if (config.IsNull())
        {
            return {};
        }
        if (!config.IsMap())
        {
            return make_unexpected(
                fmt::format("Configuration {} is not a mapping", source),
                ghafs_error_code::configuration_error
            );
        }

        // Work on a copy so that a failure leaves the context untouched
        Context updated = ctx;
        for (const auto& item : config)
        {
            std::string key = "<key>";
            try
            {
                key = item.first.as<std::string>();
                if (auto res = apply_key(updated, key, item.second, source); !res)
                {
                    return res;
                }
            }
            catch (const YAML::Exception& e)
            {
                return configuration_error(source, key, e.what());
            }
        }

        LOG_DEBUG << "Loaded configuration " << source;
        ctx = std::move(updated);
        return {};
    }

    auto load_rc_file(const std::filesystem::path& file, Context& ctx) -> expected_t<void>
    {
        std::ifstream in(file);
        if (!in)
        {
            return make_unexpected(
                fmt::format("Could not read configuration file '{}'", file.string()),
                ghafs_error_code::configuration_error
            );
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        return load_rc_string(buffer.str(), ctx, fmt::format("'{}'", file.string()));
    }
}
