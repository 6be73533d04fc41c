#include "ecp/control/DeviceControlClient.hpp"

#include "ecp/core/Error.hpp"
#include "ecp/http/CurlTransport.hpp"
#include "ecp/http/Url.hpp"
#include "ecp/log/Log.hpp"

#include <utility>

namespace ecp::control {

namespace {

// Byte length of the UTF-8 sequence starting with @p lead, 1 for bad leads.
std::size_t sequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

bool isContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

} // namespace

DeviceControlClient::DeviceControlClient()
: DeviceControlClient(ControlConfig{})
{}

DeviceControlClient::DeviceControlClient(ControlConfig config,
                                         std::shared_ptr<http::Transport> transport)
: config_(std::move(config))
, transport_(transport ? std::move(transport) : http::makeDefaultTransport())
{}

Outcome<ControlReport>
DeviceControlClient::sendCommand(const DeviceAddress& address, Command command) {
    const auto token = toToken(command);
    logInfo("[DeviceControlClient] ", address.toString(), " keypress ", token, "\n");
    return single(address.baseUrl() + config::ECP_KEYPRESS_PATH + std::string(token));
}

Outcome<ControlReport>
DeviceControlClient::launchApp(const DeviceAddress& address, std::string_view appId) {
    if (appId.empty()) {
        logError("[DeviceControlClient] launch with an empty app id\n");
        return Outcome<ControlReport>::failed(std::make_error_code(std::errc::invalid_argument));
    }
    logInfo("[DeviceControlClient] ", address.toString(), " launch ", appId, "\n");
    return single(address.baseUrl() + config::ECP_LAUNCH_PATH + http::encodePathSegment(appId));
}

Outcome<ControlReport>
DeviceControlClient::sendText(const DeviceAddress& address, std::string_view text,
                              const CancellationToken& cancel) {
    using Result = Outcome<ControlReport>;

    const auto codePoints = splitCodePoints(text);
    const std::string prefix = address.baseUrl() + config::ECP_KEYPRESS_PATH;

    ControlReport report;
    logInfo("[DeviceControlClient] ", address.toString(), " typing ",
            codePoints.size(), " character(s)\n");

    // One request at a time: the device renders literals in arrival order.
    for (const auto codePoint : codePoints) {
        if (cancel.isCancelled()) {
            logInfo("[DeviceControlClient] text cancelled after ", report.attempted,
                    " of ", codePoints.size(), " character(s)\n");
            return Result::fromFailure(config_.policy, report, make_error_code(Errc::cancelled));
        }

        ++report.attempted;
        if (auto ec = post(prefix + literalToken(codePoint)); ec) {
            ++report.failed;
            if (!report.firstError) {
                report.firstError = ec;
            }
            if (config_.policy == ErrorPolicy::Strict) {
                return Result::failed(ec);
            }
        }
    }

    if (!report.allDelivered()) {
        logError("[DeviceControlClient] ", report.failed, " of ", report.attempted,
                 " character(s) were not delivered\n");
        return Result::swallowed(report, report.firstError);
    }
    return Result::ok(report);
}

std::vector<std::string_view> DeviceControlClient::splitCodePoints(std::string_view text) {
    std::vector<std::string_view> out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t len = sequenceLength(static_cast<unsigned char>(text[pos]));
        if (pos + len > text.size()) {
            len = 1;
        }
        for (std::size_t i = 1; i < len; ++i) {
            if (!isContinuation(static_cast<unsigned char>(text[pos + i]))) {
                len = 1;
                break;
            }
        }
        out.push_back(text.substr(pos, len));
        pos += len;
    }
    return out;
}

std::string DeviceControlClient::literalToken(std::string_view codePoint) {
    return config::ECP_LITERAL_PREFIX + http::encodePathSegment(codePoint);
}

std::error_code DeviceControlClient::post(const std::string& url) {
    http::Request request;
    request.method = http::Method::Post;
    request.url = url;
    request.timeout = net::TimeoutConfig::sanitize(config_.requestTimeout);
    request.connectTimeout = config_.connectTimeout;

    auto response = transport_->perform(request);
    if (!response) {
        logError("[DeviceControlClient] POST ", url, " failed: ",
                 response.error().message(), "\n");
        return response.error();
    }
    if (response->status >= 400) {
        logError("[DeviceControlClient] POST ", url, " returned HTTP ", response->status, "\n");
        return make_error_code(Errc::http_status);
    }
    logDebug("[DeviceControlClient] POST ", url, " -> ", response->status, "\n");
    return {};
}

Outcome<ControlReport> DeviceControlClient::single(const std::string& url) {
    ControlReport report;
    report.attempted = 1;
    if (auto ec = post(url); ec) {
        report.failed = 1;
        report.firstError = ec;
        return Outcome<ControlReport>::fromFailure(config_.policy, report, ec);
    }
    return Outcome<ControlReport>::ok(report);
}

} // namespace ecp::control
