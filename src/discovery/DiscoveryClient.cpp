/**
 * @brief SSDP search round: socket setup, one M-SEARCH, bounded receive loop.
 */
#include "ecp/discovery/DiscoveryClient.hpp"

#include "ecp/core/Error.hpp"
#include "ecp/discovery/SsdpMessage.hpp"
#include "ecp/log/Log.hpp"
#include "ecp/net/NetService.hpp"
#include "ecp/net/UdpSocket.hpp"

#include <string_view>
#include <utility>

namespace ecp::discovery {

namespace asio = ecp::net::asio;
using ecp::net::udp;

DiscoveryClient::DiscoveryClient()
: DiscoveryClient(DiscoveryConfig{})
{}

DiscoveryClient::DiscoveryClient(DiscoveryConfig config)
: config_(std::move(config))
, io_(net::shared_io_context())
{}

Outcome<std::vector<DeviceAddress>>
DiscoveryClient::discover(const CancellationToken& cancel) {
    using Result = Outcome<std::vector<DeviceAddress>>;

    std::error_code ec;
    const auto group = asio::ip::make_address(config_.multicastAddress, ec);
    if (ec) {
        logError("[DiscoveryClient] bad multicast address '", config_.multicastAddress,
                 "': ", ec.message(), "\n");
        return Result::failed(make_error_code(Errc::invalid_address));
    }
    const udp::endpoint target(group, config_.port);

    std::set<DeviceAddress> found;
    std::error_code swallowed;

    for (std::size_t round = 0; round < config_.rounds; ++round) {
        if (cancel.isCancelled()) {
            logInfo("[DiscoveryClient] cancelled before round ", round + 1, "\n");
            break;
        }

        auto result = runRound(target, found, cancel);
        if (result.fatal) {
            return Result::failed(result.fatal);
        }
        if (result.swallowed) {
            if (config_.policy == ErrorPolicy::Strict) {
                return Result::failed(result.swallowed);
            }
            swallowed = result.swallowed;
        }
    }

    std::vector<DeviceAddress> devices(found.begin(), found.end());
    logInfo("[DiscoveryClient] found ", devices.size(), " device(s)\n");

    if (swallowed) {
        return Result::swallowed(std::move(devices), swallowed);
    }
    return Result::ok(std::move(devices));
}

DiscoveryClient::RoundResult
DiscoveryClient::runRound(const udp::endpoint& target,
                          std::set<DeviceAddress>& found,
                          const CancellationToken& cancel) {
    RoundResult result;
    net::UdpSocket socket(*io_);

    if (auto ec = socket.open_v4(); ec) {
        logError("[DiscoveryClient] open failed: ", ec.message(), "\n");
        result.fatal = make_error_code(Errc::socket_open_failed);
        return result;
    }
    if (auto ec = socket.bind_any(0); ec) {
        logError("[DiscoveryClient] bind failed: ", ec.message(), "\n");
        result.fatal = make_error_code(Errc::socket_bind_failed);
        return result;
    }

    // Option failures only narrow who hears us; keep going.
    if (auto ec = socket.enable_multicast_loopback(config_.multicastLoopback); ec) {
        logError("[DiscoveryClient] multicast loopback option: ", ec.message(), "\n");
    }
    if (auto ec = socket.set_multicast_ttl(config_.multicastTtl); ec) {
        logError("[DiscoveryClient] multicast TTL option: ", ec.message(), "\n");
    }

    const std::string request = ssdp::buildSearchRequest(
        config_.multicastAddress, config_.port, config_.searchTarget, config_.maxWaitSeconds);

    logDebug("[DiscoveryClient] M-SEARCH from port ", socket.local_port(),
             " to ", target.address().to_string(), ":", target.port(), "\n");

    if (auto ec = socket.send_to(request.data(), request.size(), target, config_.sendTimeout); ec) {
        logError("[DiscoveryClient] send failed: ", ec.message(), "\n");
        result.swallowed = make_error_code(Errc::send_failed);
        if (config_.policy == ErrorPolicy::Strict) {
            return result;
        }
    }

    std::vector<char> buffer(config_.maxDatagramSize);
    while (!cancel.isCancelled()) {
        udp::endpoint sender;
        std::size_t received = 0;
        auto ec = socket.recv_from(buffer.data(), buffer.size(), sender, received,
                                   config_.receiveTimeout);
        if (ec) {
            if (ec != asio::error::timed_out) {
                logDebug("[DiscoveryClient] receive ended: ", ec.message(), "\n");
            }
            break;
        }
        acceptResponse(buffer.data(), received, sender, found);
    }

    return result;
}

void DiscoveryClient::acceptResponse(const char* data, std::size_t size,
                                     const udp::endpoint& sender,
                                     std::set<DeviceAddress>& found) {
    const std::string_view response(data, size);
    auto address = ssdp::locationAddress(response);
    if (!address) {
        logDebug("[DiscoveryClient] ignored response from ",
                 sender.address().to_string(), ": ", address.error().message(), "\n");
        return;
    }

    if (found.insert(*address).second) {
        logInfo("[DiscoveryClient] device at ", address->toString(), "\n");
    }
}

} // namespace ecp::discovery
