#pragma once

#include "ecp/http/CurlTransport.hpp"
#include "ecp/http/HttpTransport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <vector>

// In-process transport that records every request and answers from a script.
class RecordingTransport : public ecp::http::Transport {
public:
    ecp::expected<ecp::http::Response> perform(const ecp::http::Request& request) override {
        ++inFlight_;
        maxInFlight_ = std::max(maxInFlight_, inFlight_);
        requests_.push_back(request);
        const std::size_t number = requests_.size(); // 1-based

        ecp::expected<ecp::http::Response> result;
        if (failing_.count(number)) {
            result = ecp::unexpected(ecp::http::make_curl_error(CURLE_COULDNT_CONNECT));
        } else {
            result = response_;
        }
        --inFlight_;
        return result;
    }

    /// Make the Nth request (1-based) fail with a connection error.
    void failRequest(std::size_t number) { failing_.insert(number); }

    void setResponse(long status, std::string body) {
        response_.status = status;
        response_.body = std::move(body);
    }

    void setContentType(std::string contentType) {
        response_.contentType = std::move(contentType);
    }

    const std::vector<ecp::http::Request>& requests() const { return requests_; }

    std::vector<std::string> urls() const {
        std::vector<std::string> out;
        for (const auto& r : requests_) out.push_back(r.url);
        return out;
    }

    int maxInFlight() const { return maxInFlight_; }

private:
    std::vector<ecp::http::Request> requests_;
    std::set<std::size_t> failing_;
    ecp::http::Response response_{200, "text/plain", ""};
    int inFlight_ = 0;
    int maxInFlight_ = 0;
};
