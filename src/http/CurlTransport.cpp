#include "ecp/http/CurlTransport.hpp"

#include "ecp/core/Error.hpp"
#include "ecp/log/Log.hpp"

#include <curl/curl.h>

#include <string>

namespace ecp::http {

namespace {

class CurlErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "curl"; }

    std::string message(int value) const override {
        return curl_easy_strerror(static_cast<CURLcode>(value));
    }
};

// libcurl wants one global init before any handle is created.
struct CurlGlobal {
    CurlGlobal() : code(curl_global_init(CURL_GLOBAL_DEFAULT)) {
        if (code != CURLE_OK) {
            logError("[CurlTransport] curl_global_init failed: ",
                     curl_easy_strerror(code), "\n");
        }
    }
    ~CurlGlobal() {
        if (code == CURLE_OK) {
            curl_global_cleanup();
        }
    }
    CURLcode code;
};

const CurlGlobal& curlGlobal() {
    static CurlGlobal global;
    return global;
}

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

std::size_t appendBody(char* data, std::size_t size, std::size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(data, size * nmemb);
    return size * nmemb;
}

} // namespace

const std::error_category& curl_category() noexcept {
    static const CurlErrorCategory category;
    return category;
}

std::error_code make_curl_error(int curlCode) noexcept {
    return {curlCode, curl_category()};
}

const char* toString(Method method) {
    switch (method) {
        case Method::Get:  return "GET";
        case Method::Post: return "POST";
    }
    return "?";
}

CurlTransport::CurlTransport() {
    curlGlobal();
}

expected<Response> CurlTransport::perform(const Request& request) {
    if (curlGlobal().code != CURLE_OK) {
        return unexpected(make_error_code(Errc::transport_unavailable));
    }

    EasyHandle easy(curl_easy_init());
    if (!easy) {
        return unexpected(make_error_code(Errc::transport_unavailable));
    }

    Response response;
    HeaderList headers;

    CURL* h = easy.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &appendBody);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    if (request.timeout.count() > 0) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    }
    if (request.connectTimeout.count() > 0) {
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connectTimeout.count()));
    }

    if (request.method == Method::Post) {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, 0L);
        // Drop the form content type curl adds to every POST.
        headers.reset(curl_slist_append(nullptr, "Content-Type:"));
        if (headers) {
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        }
    }

    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        logDebug("[CurlTransport] ", toString(request.method), " ", request.url,
                 " failed: ", curl_easy_strerror(rc), "\n");
        return unexpected(make_curl_error(rc));
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    char* contentType = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_CONTENT_TYPE, &contentType) == CURLE_OK && contentType) {
        response.contentType = contentType;
    }

    logDebug("[CurlTransport] ", toString(request.method), " ", request.url,
             " -> ", response.status, " (", response.body.size(), " bytes)\n");
    return response;
}

std::shared_ptr<Transport> makeDefaultTransport() {
    return std::make_shared<CurlTransport>();
}

} // namespace ecp::http
