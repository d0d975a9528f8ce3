// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_CORE_LOGGING_HPP
#define GHAFS_CORE_LOGGING_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   ghafs::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(ghafs::log_level::trace)
#define LOG_DEBUG       LOG(ghafs::log_level::debug)
#define LOG_INFO        LOG(ghafs::log_level::info)
#define LOG_WARNING     LOG(ghafs::log_level::warn)
#define LOG_ERROR       LOG(ghafs::log_level::err)
#define LOG_CRITICAL    LOG(ghafs::log_level::critical)
// clang-format on

namespace ghafs
{
    /** Level of logging, used to filter out logs which are at a lower level than the current one.
        @see `ghafs::LoggingParams`
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    /// @returns The name of the specified log level as an UTF-8 null-terminated string.
    inline constexpr auto name_of(log_level level) noexcept -> const char*
    {
        constexpr std::array names{ "trace", "debug", "info", "warning", "error", "critical", "off" };
        return names[static_cast<std::size_t>(level)];
    }

    /// @returns The level matching the name (as produced by `name_of`, or "warn", "err").
    [[nodiscard]] auto log_level_from_name(std::string_view name) -> std::optional<log_level>;

    /** Parameters for the logging system.
     */
    struct LoggingParams
    {
        /// Minimum level a log record must have to not be filtered out.
        log_level logging_level{ log_level::warn };

        /** Number of log records to keep in the backtrace history.
            The backtrace feature will be enabled only if the value
            is different from `0`.
        */
        std::size_t log_backtrace{ 0 };

        /// Formatting pattern to use in formatted logs.
        std::string log_pattern{ "%^%-9!l%-8n%$ %v" };

        auto operator==(const LoggingParams& other) const noexcept -> bool = default;
    };

    namespace logging
    {
        /** Creates the spdlog loggers used by the library (`ghafs` and `libcurl`) if they do
            not exist yet, then applies the parameters to them.
            @returns The previous parameters.
        */
        auto set_logging_params(LoggingParams params) -> LoggingParams;

        [[nodiscard]] auto get_logging_params() -> LoggingParams;

        /// Changes only the logging level. @returns The previous level.
        auto set_log_level(log_level level) -> log_level;

        [[nodiscard]] auto get_log_level() -> log_level;

        /// Flushes the backtrace history of every logger, if the backtrace is enabled.
        void log_backtrace();

        /** Registers a string which must never appear in logs.
            Every occurrence is replaced by `*****` before emission.
        */
        void register_secret(std::string secret);

        void clear_secrets();

        [[nodiscard]] auto hide_secrets(std::string_view message) -> std::string;

        /** Accumulates a log record and emits it when destroyed.
            Use through the `LOG_...` macros.
        */
        class MessageLogger
        {
        public:

            explicit MessageLogger(log_level level);
            ~MessageLogger();

            MessageLogger(const MessageLogger&) = delete;
            MessageLogger& operator=(const MessageLogger&) = delete;

            std::stringstream& stream();

        private:

            log_level m_level;
            std::stringstream m_stream;

            static void emit(const std::string& msg, log_level level);
        };
    }
}

#endif
