// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cctype>
#include <string_view>

#include <spdlog/spdlog.h>

#include "ghafs/core/logging.hpp"
#include "ghafs/download/transport.hpp"
#include "ghafs/util/string.hpp"

#include "curl.hpp"

namespace ghafs::download
{
    Request::Request(std::string lurl)
        : url(std::move(lurl))
    {
    }

    /*************
     * Transport *
     *************/

    Result Transport::fetch(const Request& request)
    {
        LOG_DEBUG << "GET " << request.url
                  << (request.etag ? " [If-None-Match: " + *request.etag + "]" : std::string());
        auto result = fetch_impl(request);
        if (result)
        {
            LOG_INFO << "Transfer finalized, status: " << result->transfer.http_status << " ["
                     << result->transfer.effective_url << "] " << result->transfer.downloaded_size
                     << " bytes";
        }
        else
        {
            LOG_DEBUG << "Transfer failed: " << result.error().message;
        }
        return result;
    }

    void update_etag(std::string_view header_line, std::string& etag)
    {
        if (util::starts_with(header_line, "HTTP/"))
        {
            etag.clear();
            return;
        }
        const auto [key, value] = util::split_once(header_line, ':');
        // http headers are case insensitive!
        if (!value.empty() && util::to_lower(util::strip(key)) == "etag")
        {
            etag = util::strip(value);
        }
    }

    /*****************
     * CurlTransport *
     *****************/

    namespace
    {
        struct TransferState
        {
            std::string body;
            std::string etag;
        };

        size_t write_callback(char* buffer, size_t size, size_t nbitems, void* self)
        {
            auto* state = reinterpret_cast<TransferState*>(self);
            state->body.append(buffer, size * nbitems);
            return size * nbitems;
        }

        size_t header_callback(char* buffer, size_t size, size_t nbitems, void* self)
        {
            auto* state = reinterpret_cast<TransferState*>(self);
            const size_t buffer_size = size * nbitems;
            update_etag(std::string_view(buffer, buffer_size), state->etag);
            return buffer_size;
        }

        int debug_callback(
            CURL* /* handle */,
            curl_infotype type,
            char* data,
            size_t size,
            void* userptr
        )
        {
            auto* logger = reinterpret_cast<spdlog::logger*>(userptr);
            if (logger == nullptr)
            {
                return 0;
            }
            const auto msg = util::rstrip(std::string_view(data, size));
            switch (type)
            {
                case CURLINFO_TEXT:
                    logger->info("* {}", logging::hide_secrets(msg));
                    break;
                case CURLINFO_HEADER_OUT:
                    logger->info("> {}", logging::hide_secrets(msg));
                    break;
                case CURLINFO_HEADER_IN:
                    logger->info("< {}", logging::hide_secrets(msg));
                    break;
                default:
                    break;
            }
            return 0;
        }
    }

    CurlTransport::CurlTransport(RemoteFetchParams params)
        : m_params(std::move(params))
        , p_handle(std::make_unique<CURLHandle>())
    {
    }

    CurlTransport::~CurlTransport() = default;

    Result CurlTransport::fetch_impl(const Request& request)
    {
        TransferState state;
        try
        {
            p_handle->reset_handle();
            p_handle->configure_handle(
                request.url,
                m_params.connect_timeout_secs,
                m_params.transfer_timeout_secs,
                m_params.proxy,
                m_params.ssl_verify
            );

            p_handle->set_opt(CURLOPT_HEADERFUNCTION, &header_callback);
            p_handle->set_opt(CURLOPT_HEADERDATA, &state);
            p_handle->set_opt(CURLOPT_WRITEFUNCTION, &write_callback);
            p_handle->set_opt(CURLOPT_WRITEDATA, &state);

            if (request.authentication.has_value())
            {
                p_handle->set_opt(CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
                p_handle->set_opt(CURLOPT_USERNAME, request.authentication->user);
                p_handle->set_opt(CURLOPT_PASSWORD, request.authentication->password);
            }

            p_handle->add_header(fmt::format("User-Agent: {} {}", m_params.user_agent, curl_version()));
            p_handle->add_header("Accept: application/vnd.github+json");
            if (request.etag.has_value())
            {
                p_handle->add_header("If-None-Match: " + request.etag.value());
            }
            p_handle->set_opt_header();

            auto logger = spdlog::get("libcurl");
            const bool verbose = logger && logger->should_log(spdlog::level::debug);
            p_handle->set_opt(CURLOPT_VERBOSE, verbose);
            p_handle->set_opt(CURLOPT_DEBUGFUNCTION, &debug_callback);
            p_handle->set_opt(CURLOPT_DEBUGDATA, logger.get());
        }
        catch (const curl_error& e)
        {
            return tl::make_unexpected(Error{ e.what(), std::nullopt });
        }

        const CURLcode res = p_handle->perform();
        if (!CURLHandle::is_curl_res_ok(res))
        {
            const std::string detail = p_handle->get_error_buffer();
            return tl::make_unexpected(Error{
                fmt::format(
                    "Download error ({}) {} [{}]\n{}",
                    static_cast<int>(res),
                    CURLHandle::get_res_error(res),
                    request.url,
                    detail
                ),
                std::nullopt,
            });
        }

        Success success;
        success.transfer.http_status = p_handle->get_info<int>(CURLINFO_RESPONSE_CODE).value_or(0);
        success.transfer.effective_url = p_handle->get_curl_effective_url();
        success.transfer.downloaded_size = p_handle->get_info<std::size_t>(CURLINFO_SIZE_DOWNLOAD_T)
                                               .value_or(state.body.size());
        success.etag = std::move(state.etag);
        success.body = std::move(state.body);
        return success;
    }

    /******************
     * CurlGlobalInit *
     ******************/

    CurlGlobalInit::CurlGlobalInit()
    {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
        {
            throw curl_error("Could not initialize libcurl");
        }
    }

    CurlGlobalInit::~CurlGlobalInit()
    {
        curl_global_cleanup();
    }
}
