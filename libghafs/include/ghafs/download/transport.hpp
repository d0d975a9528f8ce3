// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_DOWNLOAD_TRANSPORT_HPP
#define GHAFS_DOWNLOAD_TRANSPORT_HPP

#include <memory>
#include <string>
#include <string_view>

#include "ghafs/download/parameters.hpp"
#include "ghafs/download/request.hpp"

namespace ghafs::download
{
    /**
     * Performs one blocking HTTP GET per call.
     *
     * Any HTTP status is reported as a `Success`, only network-level failures
     * (resolution, connection, TLS, timeout) are reported as an `Error`.
     * Implementations do not retry.
     */
    class Transport
    {
    public:

        virtual ~Transport() = default;

        Transport(const Transport&) = delete;
        Transport& operator=(const Transport&) = delete;
        Transport(Transport&&) = delete;
        Transport& operator=(Transport&&) = delete;

        Result fetch(const Request& request);

    protected:

        Transport() = default;

    private:

        virtual Result fetch_impl(const Request& request) = 0;
    };

    /**
     * Tracks the ETag of the last response while its header lines are received.
     *
     * A status line ("HTTP/...") starts a new response and forgets the ETag of the
     * previous one, as a redirect response may carry its own.
     */
    void update_etag(std::string_view header_line, std::string& etag);

    class CURLHandle;

    class CurlTransport final : public Transport
    {
    public:

        explicit CurlTransport(RemoteFetchParams params);
        ~CurlTransport() override;

    private:

        Result fetch_impl(const Request& request) override;

        RemoteFetchParams m_params;
        std::unique_ptr<CURLHandle> p_handle;
    };

    /// Global libcurl initialization, must outlive every transport.
    class CurlGlobalInit
    {
    public:

        CurlGlobalInit();
        ~CurlGlobalInit();

        CurlGlobalInit(const CurlGlobalInit&) = delete;
        CurlGlobalInit& operator=(const CurlGlobalInit&) = delete;
    };
}

#endif
