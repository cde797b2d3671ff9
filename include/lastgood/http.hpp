#pragma once

#include <lastgood/result.hpp>
#include <string>

namespace lastgood {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Blocking GET. A non-2xx status is a response, not an error; only
// transport-level failures are reported as Network errors.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual Result<HttpResponse> get(const std::string& url) = 0;
};

// libcurl easy-handle client. One handle per request, redirects followed.
class CurlHttpClient : public HttpClient {
public:
    // timeout_seconds <= 0 leaves the transport default (no timeout)
    explicit CurlHttpClient(long timeout_seconds = 0);

    Result<HttpResponse> get(const std::string& url) override;

private:
    long timeout_seconds_;
};

} // namespace lastgood
