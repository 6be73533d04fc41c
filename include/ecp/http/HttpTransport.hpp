#pragma once

#include "ecp/core/Expected.hpp"

#include <chrono>
#include <string>

namespace ecp::http {

enum class Method {
    Get,
    Post
};

const char* toString(Method method);

struct Request {
    Method method = Method::Get;
    std::string url;
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds connectTimeout{0};
};

struct Response {
    long status = 0;
    std::string contentType;
    std::string body;
};

/**
 * @brief One synchronous HTTP round trip.
 *
 * Implementations must finish (or fail) the request before returning and must
 * not keep connections open between calls. An answered request is a success
 * whatever its status code; callers inspect `Response::status`.
 *
 * The catalog fetcher and control client take a `shared_ptr<Transport>` so
 * tests can observe the exact request sequence.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual expected<Response> perform(const Request& request) = 0;
};

} // namespace ecp::http
