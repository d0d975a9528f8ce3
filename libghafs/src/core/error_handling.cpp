// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "ghafs/core/error_handling.hpp"
#include "ghafs/core/logging.hpp"

namespace ghafs
{
    namespace
    {
        void maybe_dump_backtrace(ghafs_error_code ec)
        {
            if (ec == ghafs_error_code::internal_failure || ec == ghafs_error_code::cache_consistency)
            {
                logging::log_backtrace();
            }
        }
    }

    auto name_of(ghafs_error_code ec) noexcept -> std::string_view
    {
        switch (ec)
        {
            case ghafs_error_code::transport_error:
                return "transport error";
            case ghafs_error_code::decode_error:
                return "decode error";
            case ghafs_error_code::cache_consistency:
                return "cache consistency error";
            case ghafs_error_code::configuration_error:
                return "configuration error";
            case ghafs_error_code::incorrect_usage:
                return "incorrect usage";
            case ghafs_error_code::mount_failure:
                return "mount failure";
            case ghafs_error_code::internal_failure:
                return "internal failure";
            default:
                return "unknown error";
        }
    }

    ghafs_error::ghafs_error(const std::string& msg, ghafs_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
        maybe_dump_backtrace(m_error_code);
    }

    ghafs_error::ghafs_error(const char* msg, ghafs_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
        maybe_dump_backtrace(m_error_code);
    }

    ghafs_error::ghafs_error(const std::string& msg, ghafs_error_code ec, std::any&& data)
        : base_type(msg)
        , m_error_code(ec)
        , m_data(std::move(data))
    {
        maybe_dump_backtrace(m_error_code);
    }

    ghafs_error_code ghafs_error::error_code() const noexcept
    {
        return m_error_code;
    }

    const std::any& ghafs_error::data() const noexcept
    {
        return m_data;
    }

    tl::unexpected<ghafs_error> make_unexpected(const char* msg, ghafs_error_code ec)
    {
        return tl::make_unexpected(ghafs_error(msg, ec));
    }

    tl::unexpected<ghafs_error> make_unexpected(const std::string& msg, ghafs_error_code ec)
    {
        return tl::make_unexpected(ghafs_error(msg, ec));
    }

    tl::unexpected<ghafs_error>
    make_unexpected(const std::string& msg, ghafs_error_code ec, std::any&& data)
    {
        return tl::make_unexpected(ghafs_error(msg, ec, std::move(data)));
    }
}
