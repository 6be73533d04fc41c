#pragma once

#include "ecp/core/Cancellation.hpp"
#include "ecp/core/DeviceAddress.hpp"
#include "ecp/core/EcpConfig.hpp"
#include "ecp/core/Outcome.hpp"
#include "ecp/net/NetConfig.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace ecp::discovery {

struct DiscoveryConfig {
    std::string multicastAddress = config::SSDP_MULTICAST_ADDRESS;
    std::uint16_t port = config::SSDP_PORT;
    std::string searchTarget = config::SSDP_SEARCH_TARGET;
    unsigned maxWaitSeconds = config::SSDP_MAX_WAIT_SECONDS;
    int multicastTtl = config::SSDP_MULTICAST_TTL;
    bool multicastLoopback = true;
    /// Receiving stops once this long passes without a datagram.
    std::chrono::milliseconds receiveTimeout = config::SSDP_RECEIVE_WINDOW;
    std::chrono::milliseconds sendTimeout = config::SSDP_SEND_TIMEOUT;
    std::size_t rounds = config::SSDP_ROUNDS;
    std::size_t maxDatagramSize = config::SSDP_MAX_DATAGRAM;
    ErrorPolicy policy = ErrorPolicy::Lenient;
};

/**
 * @brief Finds ECP devices with an SSDP `M-SEARCH`.
 *
 * Each round opens a fresh UDP socket on an ephemeral port, sends the search
 * once and collects `LOCATION` headers until `receiveTimeout` passes with
 * nothing received. Addresses are de-duplicated across rounds and returned
 * sorted.
 *
 * Error handling:
 * - Socket open/bind failure (or an unusable group address) is an `Error`
 *   whatever the policy.
 * - A failed send is swallowed (`EmptyOk`) when lenient, an `Error` when strict.
 * - Responses without a usable `LOCATION` are skipped; receive errors end the
 *   round. Neither fails the call.
 *
 * The socket is owned by the round and closed before it returns.
 */
class DiscoveryClient {
public:
    DiscoveryClient();
    explicit DiscoveryClient(DiscoveryConfig config);

    const DiscoveryConfig& config() const { return config_; }

    Outcome<std::vector<DeviceAddress>>
    discover(const CancellationToken& cancel = CancellationToken::none());

private:
    struct RoundResult {
        std::error_code fatal;
        std::error_code swallowed;
    };

    RoundResult runRound(const net::udp::endpoint& target,
                         std::set<DeviceAddress>& found,
                         const CancellationToken& cancel);

    void acceptResponse(const char* data, std::size_t size,
                        const net::udp::endpoint& sender,
                        std::set<DeviceAddress>& found);

    DiscoveryConfig config_;
    std::shared_ptr<net::asio::io_context> io_;
};

} // namespace ecp::discovery
