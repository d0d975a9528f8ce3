// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_CORE_ERROR_HANDLING_HPP
#define GHAFS_CORE_ERROR_HANDLING_HPP

#include <any>
#include <stdexcept>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace ghafs
{

    /*********************
     * ghafs exceptions *
     *********************/

    enum class ghafs_error_code
    {
        unknown,
        transport_error,
        decode_error,
        cache_consistency,
        configuration_error,
        incorrect_usage,
        mount_failure,
        internal_failure
    };

    [[nodiscard]] auto name_of(ghafs_error_code ec) noexcept -> std::string_view;

    class ghafs_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        ghafs_error(const std::string& msg, ghafs_error_code ec);
        ghafs_error(const char* msg, ghafs_error_code ec);
        ghafs_error(const std::string& msg, ghafs_error_code ec, std::any&& data);

        ghafs_error_code error_code() const noexcept;
        const std::any& data() const noexcept;

    private:

        ghafs_error_code m_error_code;
        std::any m_data;
    };

    template <class T, class E = ghafs_error>
    using expected_t = tl::expected<T, E>;

    /********************
     * helper functions *
     ********************/

    tl::unexpected<ghafs_error> make_unexpected(const char* msg, ghafs_error_code ec);

    tl::unexpected<ghafs_error> make_unexpected(const std::string& msg, ghafs_error_code ec);

    tl::unexpected<ghafs_error>
    make_unexpected(const std::string& msg, ghafs_error_code ec, std::any&& data);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp);

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp);

    template <class E>
    void extract(tl::expected<void, E>&& exp);

    /***********************************
     * helper functions implementation *
     ***********************************/

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }

    namespace detail
    {
        template <class T>
        decltype(auto) extract_impl(T&& exp)
        {
            if (exp)
            {
                return std::forward<T>(exp).value();
            }
            else
            {
                throw exp.error();
            }
        }
    }

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp)
    {
        return detail::extract_impl(std::move(exp));
    }

    template <class E>
    void extract(tl::expected<void, E>&& exp)
    {
        if (!exp)
        {
            throw exp.error();
        }
    }
}

#endif
