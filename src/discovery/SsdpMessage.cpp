#include "ecp/discovery/SsdpMessage.hpp"

#include "ecp/core/Error.hpp"
#include "ecp/http/Url.hpp"

#include <cctype>
#include <sstream>

namespace ecp::discovery::ssdp {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string buildSearchRequest(std::string_view groupAddress,
                               std::uint16_t port,
                               std::string_view searchTarget,
                               unsigned maxWaitSeconds) {
    std::ostringstream os;
    os << "M-SEARCH * HTTP/1.1\r\n"
       << "HOST: " << groupAddress << ':' << port << "\r\n"
       << "MAN: \"ssdp:discover\"\r\n"
       << "ST: " << searchTarget << "\r\n"
       << "MX: " << maxWaitSeconds << "\r\n"
       << "\r\n";
    return os.str();
}

std::optional<std::string_view> findHeader(std::string_view message, std::string_view name) {
    while (!message.empty()) {
        const auto eol = message.find('\n');
        std::string_view line = message.substr(0, eol);
        message = eol == std::string_view::npos ? std::string_view{} : message.substr(eol + 1);

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        if (equalsIgnoreCase(trim(line.substr(0, colon)), name)) {
            return trim(line.substr(colon + 1));
        }
    }
    return std::nullopt;
}

expected<DeviceAddress> locationAddress(std::string_view response) {
    const auto location = findHeader(response, "LOCATION");
    if (!location || location->empty()) {
        return unexpected(make_error_code(Errc::missing_location));
    }
    return http::addressFromUrl(*location);
}

} // namespace ecp::discovery::ssdp
