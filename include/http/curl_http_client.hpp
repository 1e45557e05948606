#pragma once

#include "http/http_client.hpp"
#include <curl/curl.h>

namespace loadpulse {
namespace http {

/**
 * Process-wide libcurl initialization. Create one in main() before any
 * worker thread starts; curl_global_init is not thread-safe.
 */
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/**
 * HttpClient backed by a single libcurl easy handle. The handle is reused
 * between requests so the connection is kept alive across iterations.
 */
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse send(const HttpRequest& request) override;

    static HttpClientFactory factory();

private:
    static size_t drainCallback(char* data, size_t size, size_t nmemb, void* userdata);

    CURL* handle_;
};

} // namespace http
} // namespace loadpulse
