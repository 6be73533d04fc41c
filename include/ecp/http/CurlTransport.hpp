#pragma once

#include "ecp/http/HttpTransport.hpp"

#include <memory>
#include <system_error>

namespace ecp::http {

/// Error category for `CURLcode` values; messages come from `curl_easy_strerror`.
const std::error_category& curl_category() noexcept;

std::error_code make_curl_error(int curlCode) noexcept;

/**
 * @brief `Transport` backed by a fresh libcurl easy handle per request.
 *
 * POST requests are sent with an empty body and no `Content-Type`. Redirects
 * are not followed. Signals are disabled so timeouts work off the main thread.
 */
class CurlTransport : public Transport {
public:
    CurlTransport();

    expected<Response> perform(const Request& request) override;
};

std::shared_ptr<Transport> makeDefaultTransport();

} // namespace ecp::http
