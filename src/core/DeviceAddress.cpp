#include "ecp/core/DeviceAddress.hpp"

#include "ecp/core/Error.hpp"

#include <cctype>
#include <utility>

namespace ecp {

namespace {

std::string formatAddress(const std::string& host, std::uint16_t port) {
    const bool v6 = host.find(':') != std::string::npos;
    std::string out;
    out.reserve(host.size() + 8);
    if (v6) out += '[';
    out += host;
    if (v6) out += ']';
    out += ':';
    out += std::to_string(port);
    return out;
}

bool parsePort(std::string_view digits, std::uint16_t& port) {
    if (digits.empty() || digits.size() > 5) {
        return false;
    }
    unsigned long value = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value == 0 || value > 65535) {
        return false;
    }
    port = static_cast<std::uint16_t>(value);
    return true;
}

bool validHostChars(std::string_view host, bool allowColon) {
    for (char c : host) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || std::iscntrl(uc)) return false;
        if (c == '/' || c == '@' || c == '?' || c == '#' || c == '[' || c == ']') return false;
        if (c == ':' && !allowColon) return false;
    }
    return true;
}

} // namespace

DeviceAddress::DeviceAddress(std::string host, std::uint16_t port)
: host_(std::move(host))
, port_(port)
, text_(formatAddress(host_, port_))
{}

expected<DeviceAddress> DeviceAddress::parse(std::string_view text) {
    std::string_view host;
    std::string_view portText;

    if (!text.empty() && text.front() == '[') {
        const auto close = text.find(']');
        if (close == std::string_view::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            return unexpected(make_error_code(Errc::invalid_address));
        }
        host = text.substr(1, close - 1);
        portText = text.substr(close + 2);
        if (!validHostChars(host, true)) {
            return unexpected(make_error_code(Errc::invalid_address));
        }
    } else {
        const auto colon = text.rfind(':');
        if (colon == std::string_view::npos) {
            return unexpected(make_error_code(Errc::invalid_address));
        }
        host = text.substr(0, colon);
        portText = text.substr(colon + 1);
        if (!validHostChars(host, false)) {
            return unexpected(make_error_code(Errc::invalid_address));
        }
    }

    std::uint16_t port = 0;
    if (host.empty() || !parsePort(portText, port)) {
        return unexpected(make_error_code(Errc::invalid_address));
    }
    return DeviceAddress(std::string(host), port);
}

std::string DeviceAddress::baseUrl() const {
    return "http://" + text_;
}

} // namespace ecp
