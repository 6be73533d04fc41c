#include "ecp/http/Url.hpp"

#include "ecp/core/Error.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <memory>
#include <utility>

namespace ecp::http {

namespace {

struct UrlDeleter {
    void operator()(CURLU* url) const { curl_url_cleanup(url); }
};

struct CurlStringDeleter {
    void operator()(char* text) const { curl_free(text); }
};

using UrlHandle = std::unique_ptr<CURLU, UrlDeleter>;
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

CurlString getPart(CURLU* url, CURLUPart part) {
    char* raw = nullptr;
    if (curl_url_get(url, part, &raw, 0) != CURLUE_OK) {
        return CurlString{};
    }
    return CurlString{raw};
}

bool isUnreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
        || c == '-' || c == '.' || c == '_' || c == '~';
}

} // namespace

expected<DeviceAddress> addressFromUrl(std::string_view url) {
    UrlHandle handle(curl_url());
    if (!handle) {
        return unexpected(make_error_code(Errc::transport_unavailable));
    }

    const std::string text(url);
    if (curl_url_set(handle.get(), CURLUPART_URL, text.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
        return unexpected(make_error_code(Errc::invalid_url));
    }

    CurlString host = getPart(handle.get(), CURLUPART_HOST);
    CurlString port = getPart(handle.get(), CURLUPART_PORT);
    if (!host || !port) {
        return unexpected(make_error_code(Errc::invalid_url));
    }

    std::string hostText(host.get());
    if (hostText.size() >= 2 && hostText.front() == '[' && hostText.back() == ']') {
        hostText = hostText.substr(1, hostText.size() - 2);
    }
    if (hostText.empty()) {
        return unexpected(make_error_code(Errc::invalid_url));
    }

    char* end = nullptr;
    const long value = std::strtol(port.get(), &end, 10);
    if (end == port.get() || *end != '\0' || value <= 0 || value > 65535) {
        return unexpected(make_error_code(Errc::invalid_url));
    }

    return DeviceAddress(std::move(hostText), static_cast<std::uint16_t>(value));
}

std::string encodePathSegment(std::string_view bytes) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(bytes.size());
    for (char ch : bytes) {
        const auto c = static_cast<unsigned char>(ch);
        if (isUnreserved(c)) {
            out += ch;
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

} // namespace ecp::http
