#include "ecp/catalog/AppCatalogFetcher.hpp"

#include "ecp/core/Error.hpp"
#include "ecp/http/CurlTransport.hpp"
#include "ecp/log/Log.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace ecp::catalog {

namespace {

// An absent Content-Type is accepted; otherwise text/* or any XML type.
bool isTextual(const std::string& contentType) {
    std::string lower;
    lower.reserve(contentType.size());
    for (char c : contentType) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower.empty() || lower.rfind("text/", 0) == 0 || lower.find("xml") != std::string::npos;
}

} // namespace

AppCatalogFetcher::AppCatalogFetcher()
: AppCatalogFetcher(CatalogConfig{})
{}

AppCatalogFetcher::AppCatalogFetcher(CatalogConfig config,
                                     std::shared_ptr<http::Transport> transport)
: config_(std::move(config))
, transport_(transport ? std::move(transport) : http::makeDefaultTransport())
{}

Outcome<std::vector<AppEntry>> AppCatalogFetcher::fetchApps(const DeviceAddress& address) {
    using Result = Outcome<std::vector<AppEntry>>;

    http::Request request;
    request.method = http::Method::Get;
    request.url = address.baseUrl() + config::ECP_APPS_PATH;
    request.timeout = net::TimeoutConfig::sanitize(config_.requestTimeout);
    request.connectTimeout = config_.connectTimeout;

    auto response = transport_->perform(request);
    if (!response) {
        logError("[AppCatalogFetcher] GET ", request.url, " failed: ",
                 response.error().message(), "\n");
        return Result::fromFailure(config_.policy, {}, response.error());
    }

    if (response->status >= 400) {
        logError("[AppCatalogFetcher] GET ", request.url, " returned HTTP ",
                 response->status, "\n");
        return Result::fromFailure(config_.policy, {}, make_error_code(Errc::http_status));
    }

    if (!isTextual(response->contentType)) {
        logError("[AppCatalogFetcher] GET ", request.url, " returned '",
                 response->contentType, "', not a catalog\n");
        return Result::fromFailure(config_.policy, {}, make_error_code(Errc::unexpected_content_type));
    }

    auto apps = parseAppCatalog(response->body);
    logInfo("[AppCatalogFetcher] ", address.toString(), " lists ", apps.size(), " app(s)\n");
    return Result::ok(std::move(apps));
}

} // namespace ecp::catalog
