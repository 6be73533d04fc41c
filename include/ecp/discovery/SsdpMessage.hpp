// SsdpMessage.hpp
// -----------------------------------------------------------------------------
// Text framing for SSDP search requests and responses. Kept apart from the
// socket code so the framing can be exercised without a network.

#pragma once

#include "ecp/core/DeviceAddress.hpp"
#include "ecp/core/Expected.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ecp::discovery::ssdp {

/**
 * @brief Build an `M-SEARCH` request.
 *
 * Lines are CRLF terminated and the message ends with an empty line:
 *
 *     M-SEARCH * HTTP/1.1
 *     HOST: <group>:<port>
 *     MAN: "ssdp:discover"
 *     ST: <searchTarget>
 *     MX: <maxWaitSeconds>
 */
std::string buildSearchRequest(std::string_view groupAddress,
                               std::uint16_t port,
                               std::string_view searchTarget,
                               unsigned maxWaitSeconds);

/**
 * @brief Value of the first header named @p name (case-insensitive), trimmed.
 *
 * Accepts LF or CRLF line endings. A line counts as a header when the text
 * before its first colon equals @p name once trimmed; the start line of a
 * well-formed message has no such colon. Returns nothing when no line
 * carries the header.
 */
std::optional<std::string_view> findHeader(std::string_view message, std::string_view name);

/**
 * @brief Device address announced by a search response.
 *
 * Reads the `LOCATION` header and keeps the URL's host and explicit port.
 * Fails with `Errc::missing_location` or `Errc::invalid_url`.
 */
expected<DeviceAddress> locationAddress(std::string_view response);

} // namespace ecp::discovery::ssdp
