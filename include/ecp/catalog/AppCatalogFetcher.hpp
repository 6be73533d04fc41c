#pragma once

#include "ecp/catalog/AppCatalog.hpp"
#include "ecp/core/DeviceAddress.hpp"
#include "ecp/core/EcpConfig.hpp"
#include "ecp/core/Outcome.hpp"
#include "ecp/http/HttpTransport.hpp"
#include "ecp/net/TimeoutConfig.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace ecp::catalog {

struct CatalogConfig {
    std::chrono::milliseconds requestTimeout = net::TimeoutConfig::defaultTimeout();
    std::chrono::milliseconds connectTimeout = config::ECP_CONNECT_TIMEOUT;
    ErrorPolicy policy = ErrorPolicy::Lenient;
};

/**
 * @brief Reads the installed-app list with `GET /query/apps`.
 *
 * A device that answers with no records yields `Ok` and an empty list.
 * Transport failures, HTTP error statuses and non-text bodies (anything but
 * `text/*` or an XML type) yield an empty list (`EmptyOk`) when lenient,
 * `Error` when strict.
 */
class AppCatalogFetcher {
public:
    AppCatalogFetcher();
    explicit AppCatalogFetcher(CatalogConfig config,
                               std::shared_ptr<http::Transport> transport = nullptr);

    Outcome<std::vector<AppEntry>> fetchApps(const DeviceAddress& address);

    const CatalogConfig& config() const { return config_; }

private:
    CatalogConfig config_;
    std::shared_ptr<http::Transport> transport_;
};

} // namespace ecp::catalog
