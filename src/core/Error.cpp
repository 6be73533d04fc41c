#include "ecp/core/Error.hpp"

#include <string>

namespace ecp {

namespace {

class EcpErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "ecp"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::socket_open_failed:    return "could not open socket";
            case Errc::socket_bind_failed:    return "could not bind socket";
            case Errc::send_failed:           return "datagram was not sent";
            case Errc::http_status:           return "device answered with an HTTP error status";
            case Errc::invalid_address:       return "invalid device address";
            case Errc::invalid_url:           return "invalid URL";
            case Errc::missing_location:      return "response has no LOCATION header";
            case Errc::cancelled:             return "operation cancelled";
            case Errc::transport_unavailable: return "HTTP transport unavailable";
            case Errc::unexpected_content_type: return "device answered with a non-text body";
        }
        return "unknown ecp error";
    }
};

} // namespace

const std::error_category& error_category() noexcept {
    static const EcpErrorCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace ecp
