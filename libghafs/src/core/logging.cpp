// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <memory>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "ghafs/core/logging.hpp"
#include "ghafs/util/string.hpp"
#include "ghafs/util/synchronized_value.hpp"

namespace ghafs
{
    auto log_level_from_name(std::string_view name) -> std::optional<log_level>
    {
        const auto lname = util::to_lower(util::strip(name));
        for (auto level : { log_level::trace,
                            log_level::debug,
                            log_level::info,
                            log_level::warn,
                            log_level::err,
                            log_level::critical,
                            log_level::off })
        {
            if (lname == name_of(level))
            {
                return level;
            }
        }
        if (lname == "warn")
        {
            return log_level::warn;
        }
        if (lname == "err")
        {
            return log_level::err;
        }
        return std::nullopt;
    }

    namespace logging
    {
        namespace
        {
            constexpr std::array logger_names{ "ghafs", "libcurl" };

            util::synchronized_value<LoggingParams> logging_params;
            util::synchronized_value<std::vector<std::string>> secrets;

            auto to_spdlog(log_level level) -> spdlog::level::level_enum
            {
                switch (level)
                {
                    case log_level::trace:
                        return spdlog::level::trace;
                    case log_level::debug:
                        return spdlog::level::debug;
                    case log_level::info:
                        return spdlog::level::info;
                    case log_level::warn:
                        return spdlog::level::warn;
                    case log_level::err:
                        return spdlog::level::err;
                    case log_level::critical:
                        return spdlog::level::critical;
                    default:
                        return spdlog::level::off;
                }
            }

            auto get_or_create_logger(const std::string& name) -> std::shared_ptr<spdlog::logger>
            {
                auto logger = spdlog::get(name);
                if (!logger)
                {
                    logger = spdlog::stderr_color_mt(name);
                }
                return logger;
            }

            void apply_params(const LoggingParams& params)
            {
                for (const std::string name : logger_names)
                {
                    auto logger = get_or_create_logger(name);
                    logger->set_pattern(params.log_pattern);
                    logger->set_level(to_spdlog(params.logging_level));
                    if (params.log_backtrace > 0)
                    {
                        logger->enable_backtrace(params.log_backtrace);
                    }
                    else
                    {
                        logger->disable_backtrace();
                    }
                }
            }

            auto main_logger() -> std::shared_ptr<spdlog::logger>
            {
                auto logger = spdlog::get(logger_names[0]);
                if (!logger)
                {
                    apply_params(logging_params.value());
                    logger = spdlog::get(logger_names[0]);
                }
                return logger;
            }
        }

        auto set_logging_params(LoggingParams params) -> LoggingParams
        {
            auto synched_params = logging_params.synchronize();
            LoggingParams previous = std::exchange(*synched_params, std::move(params));
            apply_params(*synched_params);
            return previous;
        }

        auto get_logging_params() -> LoggingParams
        {
            return logging_params.value();
        }

        auto set_log_level(log_level level) -> log_level
        {
            auto synched_params = logging_params.synchronize();
            const auto previous = std::exchange(synched_params->logging_level, level);
            apply_params(*synched_params);
            return previous;
        }

        auto get_log_level() -> log_level
        {
            return logging_params->logging_level;
        }

        void log_backtrace()
        {
            if (logging_params->log_backtrace == 0)
            {
                return;
            }
            for (const std::string name : logger_names)
            {
                if (auto logger = spdlog::get(name))
                {
                    logger->dump_backtrace();
                }
            }
        }

        void register_secret(std::string secret)
        {
            if (secret.empty())
            {
                return;
            }
            auto synched_secrets = secrets.synchronize();
            if (std::find(synched_secrets->begin(), synched_secrets->end(), secret)
                == synched_secrets->end())
            {
                synched_secrets->push_back(std::move(secret));
            }
        }

        void clear_secrets()
        {
            secrets->clear();
        }

        auto hide_secrets(std::string_view message) -> std::string
        {
            auto result = std::string(message);
            secrets.apply(
                [&result](const std::vector<std::string>& all)
                {
                    for (const auto& secret : all)
                    {
                        util::replace_all(result, secret, "*****");
                    }
                }
            );
            return result;
        }

        MessageLogger::MessageLogger(log_level level)
            : m_level(level)
            , m_stream()
        {
        }

        MessageLogger::~MessageLogger()
        {
            emit(m_stream.str(), m_level);
        }

        std::stringstream& MessageLogger::stream()
        {
            return m_stream;
        }

        void MessageLogger::emit(const std::string& msg, log_level level)
        {
            if (level == log_level::off)
            {
                return;
            }
            auto logger = main_logger();
            const auto str = hide_secrets(msg);
            logger->log(to_spdlog(level), str);
            if (level == log_level::critical)
            {
                logger->flush();
            }
        }
    }
}
