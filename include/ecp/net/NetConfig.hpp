#pragma once

#include <asio.hpp>
#include <chrono>
#include <system_error>

namespace ecp::net {

/**
 * @brief Networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `ecp::net::asio` as the standalone Asio namespace.
 * - `ecp::net::udp` as the protocol alias used by discovery.
 * - `error_code` / `milliseconds` for socket helper signatures.
 */
namespace asio = ::asio;

using udp = asio::ip::udp;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace ecp::net
