#pragma once
#include "ecp/net/NetConfig.hpp"
#include "ecp/net/Deadline.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <vector>

namespace ecp::net {

/**
 * UdpSocket
 *
 * Small blocking wrapper for datagram work such as SSDP discovery.
 *
 * - `send_to` / `recv_from` use `with_deadline` so every call is bounded.
 * - Multicast options are exposed individually; failures are returned so the
 *   caller decides whether they matter.
 * - The socket is closed by the destructor on every exit path.
 */
class UdpSocket {
public:
    explicit UdpSocket(asio::io_context& io) : sock_(io) {}
    ~UdpSocket() { close(); }

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    error_code open_v4() {
        error_code ec;
        sock_.open(udp::v4(), ec);
        return ec;
    }

    /// Bind to INADDR_ANY. Port 0 asks the OS for an ephemeral port.
    error_code bind_any(std::uint16_t port) {
        error_code ec;
        sock_.bind(udp::endpoint(udp::v4(), port), ec);
        return ec;
    }

    error_code enable_multicast_loopback(bool on = true) {
        error_code ec;
        sock_.set_option(asio::ip::multicast::enable_loopback(on), ec);
        return ec;
    }

    error_code set_multicast_ttl(int hops) {
        error_code ec;
        sock_.set_option(asio::ip::multicast::hops(hops), ec);
        return ec;
    }

    std::uint16_t local_port() const {
        error_code ec;
        auto ep = sock_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    // Send one datagram, fail if not sent within timeout.
    error_code send_to(const void* data, std::size_t n,
                       const udp::endpoint& ep, milliseconds timeout) {
        auto payload = std::make_shared<std::vector<std::uint8_t>>(
            static_cast<const std::uint8_t*>(data),
            static_cast<const std::uint8_t*>(data) + n);
        auto ex = sock_.get_executor();
        return with_deadline(ex, timeout,
            [&](auto cb){
                sock_.async_send_to(asio::buffer(*payload), ep, 0,
                    [payload, cb](const error_code& ec, std::size_t){ cb(ec); });
            },
            [this]{ error_code ignore; sock_.cancel(ignore); });
    }

    // Receive one datagram, with timeout. Fills out_ep and out_n on success.
    error_code recv_from(void* data, std::size_t max,
                         udp::endpoint& out_ep, std::size_t& out_n,
                         milliseconds timeout) {
        struct Slot {
            explicit Slot(std::size_t size) : buffer(size) {}
            std::vector<std::uint8_t> buffer;
            udp::endpoint sender;
            std::size_t received = 0;
        };

        auto slot = std::make_shared<Slot>(max);
        auto ex = sock_.get_executor();
        out_n = 0;
        auto ec = with_deadline(ex, timeout,
            [&](auto cb){
                sock_.async_receive_from(asio::buffer(slot->buffer), slot->sender, 0,
                    [slot, cb](const error_code& op_ec, std::size_t n){
                        slot->received = n;
                        cb(op_ec);
                    });
            },
            [this]{ error_code ignore; sock_.cancel(ignore); });

        if (!ec) {
            std::copy(slot->buffer.begin(), slot->buffer.begin() + slot->received,
                      static_cast<std::uint8_t*>(data));
            out_n = slot->received;
            out_ep = slot->sender;
        }
        return ec;
    }

    bool is_open() const { return sock_.is_open(); }
    void close() { error_code ignore; sock_.close(ignore); }

private:
    udp::socket sock_;
};

} // namespace ecp::net
