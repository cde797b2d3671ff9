#include <lastgood/http.hpp>
#include <lastgood/log.hpp>

#include <curl/curl.h>

#include <memory>

#ifndef LASTGOOD_VERSION
#define LASTGOOD_VERSION "0.0.0"
#endif

namespace lastgood {

namespace {

size_t append_body(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    size_t bytes = size * nmemb;
    body->append(static_cast<const char*>(ptr), bytes);
    return bytes;
}

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

} // namespace

CurlHttpClient::CurlHttpClient(long timeout_seconds)
    : timeout_seconds_(timeout_seconds) {}

Result<HttpResponse> CurlHttpClient::get(const std::string& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return LastgoodError{LastgoodError::Network,
            "failed to initialize HTTP client"};
    }

    HttpResponse response;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "lastgood/" LASTGOOD_VERSION);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    if (timeout_seconds_ > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    }

    log::trace("GET %s", url.c_str());
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        LastgoodError err{LastgoodError::Network, "error making request to " + url};
        err.caused_by(errbuf[0] ? errbuf : curl_easy_strerror(res));
        return err;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    log::trace("%ld %s (%zu bytes)", response.status, url.c_str(), response.body.size());
    return Result<HttpResponse>::ok(std::move(response));
}

} // namespace lastgood
