#pragma once

#include "ecp/core/Expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ecp {

/**
 * @brief `host:port` of a device's control endpoint.
 *
 * Immutable once built. Ordering and equality follow the `host:port` string
 * so sorted containers display in a stable order. IPv6 hosts are stored
 * without brackets and bracketed by `toString()`.
 */
class DeviceAddress {
public:
    DeviceAddress(std::string host, std::uint16_t port);

    /// Parse `host:port` or `[v6-host]:port`. The port is required.
    static expected<DeviceAddress> parse(std::string_view text);

    const std::string& host() const noexcept { return host_; }
    std::uint16_t port() const noexcept { return port_; }

    const std::string& toString() const noexcept { return text_; }

    /// `http://host:port` with no trailing slash.
    std::string baseUrl() const;

    friend bool operator==(const DeviceAddress& a, const DeviceAddress& b) { return a.text_ == b.text_; }
    friend bool operator!=(const DeviceAddress& a, const DeviceAddress& b) { return a.text_ != b.text_; }
    friend bool operator<(const DeviceAddress& a, const DeviceAddress& b) { return a.text_ < b.text_; }

private:
    std::string host_;
    std::uint16_t port_;
    std::string text_;
};

} // namespace ecp
