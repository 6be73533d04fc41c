#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace ecp::config {

/**
 * @brief Protocol constants and tunable defaults.
 *
 * The discovery timings (one round, 2 s window, TTL 4) are field-proven
 * defaults rather than protocol requirements. Override them through
 * `DiscoveryConfig` instead of editing them here.
 */

// SSDP discovery --------------------------------------------------------------
constexpr const char* SSDP_MULTICAST_ADDRESS = "239.255.255.250";
constexpr std::uint16_t SSDP_PORT = 1900;
constexpr const char* SSDP_SEARCH_TARGET = "roku:ecp";
constexpr unsigned SSDP_MAX_WAIT_SECONDS = 3;       // MX header
constexpr int SSDP_MULTICAST_TTL = 4;
constexpr std::chrono::milliseconds SSDP_RECEIVE_WINDOW{2000};
constexpr std::size_t SSDP_ROUNDS = 1;
constexpr std::size_t SSDP_MAX_DATAGRAM = 2048;
constexpr std::chrono::milliseconds SSDP_SEND_TIMEOUT{500};

// ECP HTTP control -------------------------------------------------------------
constexpr std::chrono::milliseconds ECP_REQUEST_TIMEOUT{30000};
constexpr std::chrono::milliseconds ECP_CONNECT_TIMEOUT{5000};

constexpr const char* ECP_APPS_PATH = "/query/apps";
constexpr const char* ECP_KEYPRESS_PATH = "/keypress/";
constexpr const char* ECP_LAUNCH_PATH = "/launch/";
constexpr const char* ECP_LITERAL_PREFIX = "Lit_";

} // namespace ecp::config
