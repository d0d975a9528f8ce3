// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <filesystem>

#include "ghafs/core/logging.hpp"
#include "ghafs/util/url_manip.hpp"

#include "curl.hpp"

namespace ghafs::download
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what)
        : std::runtime_error(what)
    {
    }

    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle()
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        // Set error buffer
        std::fill(m_errorbuffer.begin(), m_errorbuffer.end(), '\0');
        set_opt(CURLOPT_ERRORBUFFER, m_errorbuffer.data());
    }

    CURLHandle::~CURLHandle()
    {
        curl_easy_cleanup(m_handle);
        curl_slist_free_all(p_headers);
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
        {
            return tl::unexpected(result);
        }
        return val;
    }

    // WARNING curl_easy_getinfo MUST have its third argument pointing to long,
    // curl_off_t, char*, double, curl_slist*, curl_certinfo*, curl_tlssessioninfo*
    // or curl_socket_t depending on the used option.
    // https://curl.se/libcurl/c/curl_easy_getinfo.html

    template tl::expected<long, CURLcode> CURLHandle::get_info(CURLINFO option) const;
    template tl::expected<char*, CURLcode> CURLHandle::get_info(CURLINFO option) const;

    template <>
    tl::expected<std::size_t, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        return get_info<curl_off_t>(option).map([](curl_off_t v)
                                                { return static_cast<std::size_t>(v); });
    }

    template <>
    tl::expected<int, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        return get_info<long>(option).map([](long v) { return static_cast<int>(v); });
    }

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        return get_info<char*>(option).map([](char* v)
                                            { return v ? std::string(v) : std::string(); });
    }

    void CURLHandle::configure_handle(
        const std::string& url,
        const double connect_timeout_secs,
        const long transfer_timeout_secs,
        const std::optional<std::string>& proxy,
        const std::string& ssl_verify
    )
    {
        set_opt(CURLOPT_URL, url);
        set_opt(CURLOPT_FOLLOWLOCATION, 1L);
        set_opt(CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_1_1));
        set_opt(CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_secs));
        set_opt(CURLOPT_TIMEOUT, transfer_timeout_secs);
        // accept all encodings supported by the libcurl build
        set_opt(CURLOPT_ACCEPT_ENCODING, std::string());

        if (proxy)
        {
            set_opt(CURLOPT_PROXY, *proxy);
            LOG_INFO << "Using Proxy " << util::hide_url_credentials(*proxy);
        }

        if (ssl_verify.size())
        {
            if (ssl_verify == "<false>")
            {
                set_opt(CURLOPT_SSL_VERIFYPEER, 0L);
                set_opt(CURLOPT_SSL_VERIFYHOST, 0L);
                if (proxy)
                {
                    set_opt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
                    set_opt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
                }
            }
            else if (ssl_verify != "<system>")
            {
                if (!std::filesystem::exists(ssl_verify))
                {
                    throw curl_error("ssl_verify does not contain a valid file path.");
                }
                set_opt(CURLOPT_CAINFO, ssl_verify);
                if (proxy)
                {
                    set_opt(CURLOPT_PROXY_CAINFO, ssl_verify);
                }
            }
        }
    }

    void CURLHandle::reset_handle()
    {
        curl_easy_reset(m_handle);
        reset_headers();
        std::fill(m_errorbuffer.begin(), m_errorbuffer.end(), '\0');
        set_opt(CURLOPT_ERRORBUFFER, m_errorbuffer.data());
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        curl_slist* new_headers = curl_slist_append(p_headers, header.c_str());
        if (!new_headers)
        {
            throw curl_error("Could not add header to curl handle");
        }
        p_headers = new_headers;
        return *this;
    }

    CURLHandle& CURLHandle::reset_headers()
    {
        curl_slist_free_all(p_headers);
        p_headers = nullptr;
        return *this;
    }

    CURLHandle& CURLHandle::set_opt_header()
    {
        return set_opt(CURLOPT_HTTPHEADER, p_headers);
    }

    const char* CURLHandle::get_error_buffer() const
    {
        return m_errorbuffer.data();
    }

    std::string CURLHandle::get_curl_effective_url() const
    {
        return get_info<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
    }

    CURLcode CURLHandle::perform()
    {
        return curl_easy_perform(m_handle);
    }

    bool CURLHandle::is_curl_res_ok(CURLcode res)
    {
        return res == CURLE_OK;
    }

    std::string CURLHandle::get_res_error(CURLcode res)
    {
        return static_cast<std::string>(curl_easy_strerror(res));
    }
}
