#pragma once

#include <system_error>

namespace ecp {

/**
 * @brief Error conditions raised by the library itself.
 *
 * Transport failures reported by libcurl use their own category (see
 * `ecp::http::curl_category()`); Asio socket errors keep Asio's categories.
 */
enum class Errc {
    socket_open_failed = 1,
    socket_bind_failed,
    send_failed,
    http_status,
    invalid_address,
    invalid_url,
    missing_location,
    cancelled,
    transport_unavailable,
    unexpected_content_type,
};

const std::error_category& error_category() noexcept;

std::error_code make_error_code(Errc e) noexcept;

} // namespace ecp

namespace std {
template <>
struct is_error_code_enum<ecp::Errc> : true_type {};
} // namespace std
