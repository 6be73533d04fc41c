#pragma once

#include "ecp/core/DeviceAddress.hpp"
#include "ecp/core/Expected.hpp"

#include <string>
#include <string_view>

namespace ecp::http {

/**
 * @brief Parse an absolute URL and return its `host:port`.
 *
 * Uses libcurl's URL parser. Any scheme is accepted. The port must be written
 * explicitly in the URL; a URL without one yields `Errc::invalid_url`, as does
 * anything libcurl refuses to parse.
 */
expected<DeviceAddress> addressFromUrl(std::string_view url);

/**
 * @brief Percent-encode @p bytes for use as a single URL path segment.
 *
 * RFC 3986 unreserved characters (letters, digits, `-._~`) pass through;
 * every other byte, including space and any UTF-8 lead/continuation byte, is
 * written as `%XX` with upper-case hex digits.
 */
std::string encodePathSegment(std::string_view bytes);

} // namespace ecp::http
