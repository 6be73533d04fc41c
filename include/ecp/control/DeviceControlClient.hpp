#pragma once

#include "ecp/control/Command.hpp"
#include "ecp/core/Cancellation.hpp"
#include "ecp/core/DeviceAddress.hpp"
#include "ecp/core/EcpConfig.hpp"
#include "ecp/core/Outcome.hpp"
#include "ecp/http/HttpTransport.hpp"
#include "ecp/net/TimeoutConfig.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ecp::control {

struct ControlConfig {
    std::chrono::milliseconds requestTimeout = net::TimeoutConfig::defaultTimeout();
    std::chrono::milliseconds connectTimeout = config::ECP_CONNECT_TIMEOUT;
    ErrorPolicy policy = ErrorPolicy::Lenient;
};

/// What a control call did on the wire.
struct ControlReport {
    std::size_t attempted = 0;
    std::size_t failed = 0;
    std::error_code firstError;

    bool allDelivered() const { return failed == 0; }
};

/**
 * @brief Sends key presses, literal text and app launches to one device.
 *
 * Every request is an empty-body POST that completes before the next one
 * starts. Responses are not read beyond their status: an HTTP status of 400
 * or more counts as a failed request, like a transport error.
 *
 * With the default lenient policy failures are logged and skipped, so a
 * `sendText` keeps typing after a lost character and the outcome is
 * `EmptyOk` with a report of what was lost. The strict policy stops at the
 * first failure and returns `Error`.
 */
class DeviceControlClient {
public:
    DeviceControlClient();
    explicit DeviceControlClient(ControlConfig config,
                                 std::shared_ptr<http::Transport> transport = nullptr);

    /// POST /keypress/<token>
    Outcome<ControlReport> sendCommand(const DeviceAddress& address, Command command);

    /// POST /launch/<appId>
    Outcome<ControlReport> launchApp(const DeviceAddress& address, std::string_view appId);

    /// POST /keypress/Lit_<c> once per code point of @p text, in order.
    /// Only letters, digits and `-._~` go out as themselves; sub-delimiters
    /// such as `!'()*` are percent-encoded too, which the device decodes alike.
    Outcome<ControlReport> sendText(const DeviceAddress& address, std::string_view text,
                                    const CancellationToken& cancel = CancellationToken::none());

    const ControlConfig& config() const { return config_; }

    /// Split UTF-8 text into code points. Invalid bytes stand alone.
    static std::vector<std::string_view> splitCodePoints(std::string_view text);

    /// Keypress token for one code point: `Lit_` plus its path-encoded bytes.
    static std::string literalToken(std::string_view codePoint);

private:
    std::error_code post(const std::string& url);

    Outcome<ControlReport> single(const std::string& url);

    ControlConfig config_;
    std::shared_ptr<http::Transport> transport_;
};

} // namespace ecp::control
