#pragma once

#include "ecp/core/EcpConfig.hpp"

#include <chrono>

namespace ecp::net {

/**
 * @brief Process-wide default timeout for ECP HTTP requests.
 *
 * Catalog and control configs copy this value when they are constructed, so a
 * change only affects clients created afterwards.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    /** Set the process-wide default request timeout (clamped to >= 1 ms). */
    static void setDefault(duration timeout) {
        storage() = sanitize(timeout);
    }

    static duration defaultTimeout() {
        return storage();
    }

    /** RAII helper that temporarily overrides the default timeout. */
    class ScopedOverride {
    public:
        explicit ScopedOverride(duration timeout)
        : previous_(storage()) {
            storage() = sanitize(timeout);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            storage() = previous_;
        }

    private:
        duration previous_;
    };

    /** Clamp to at least 1 ms; libcurl treats 0 as "no timeout". */
    static duration sanitize(duration timeout) {
        return timeout.count() < 1 ? duration{1} : timeout;
    }

private:
    static duration& storage() {
        static duration timeout{config::ECP_REQUEST_TIMEOUT};
        return timeout;
    }
};

} // namespace ecp::net
