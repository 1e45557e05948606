#include "http/curl_http_client.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <cmath>

namespace loadpulse {
namespace http {

namespace {

// RAII owner for the per-request header list
struct HeaderList {
    curl_slist* list = nullptr;

    ~HeaderList() {
        if (list) {
            curl_slist_free_all(list);
        }
    }

    void append(const std::string& line) {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) {
            throw utils::TransportException("Failed to build request headers", line);
        }
        list = next;
    }
};

} // namespace

CurlGlobal::CurlGlobal() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
        throw utils::DispatchException("curl_global_init failed", curl_easy_strerror(rc));
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

CurlHttpClient::CurlHttpClient() : handle_(curl_easy_init()) {
    if (!handle_) {
        throw utils::DispatchException("curl_easy_init failed");
    }
}

CurlHttpClient::~CurlHttpClient() {
    curl_easy_cleanup(handle_);
}

HttpClientFactory CurlHttpClient::factory() {
    return []() -> std::unique_ptr<HttpClient> {
        return std::make_unique<CurlHttpClient>();
    };
}

size_t CurlHttpClient::drainCallback(char* data, size_t size, size_t nmemb, void* userdata) {
    (void)data;
    auto* total = static_cast<size_t*>(userdata);
    *total += size * nmemb;
    return size * nmemb;
}

HttpResponse CurlHttpClient::send(const HttpRequest& request) {
    // Options from the previous request must not leak into this one
    curl_easy_reset(handle_);

    HttpResponse response;
    HeaderList headers;
    for (const auto& header : request.headers) {
        headers.append(header.first + ": " + header.second);
    }

    // Saturate so an unvalidated request cannot overflow the conversion
    double timeoutSeconds = request.timeoutSeconds;
    if (!(timeoutSeconds >= 0.001)) {
        timeoutSeconds = 0.001;
    } else if (timeoutSeconds > utils::kMaxTimeoutSeconds) {
        timeoutSeconds = utils::kMaxTimeoutSeconds;
    }
    long timeoutMs = static_cast<long>(std::ceil(timeoutSeconds * 1000.0));

    curl_easy_setopt(handle_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle_, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, &CurlHttpClient::drainCallback);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &response.bodyBytes);
    if (headers.list) {
        curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers.list);
    }

    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(handle_, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
        case HttpMethod::PUT:
            curl_easy_setopt(handle_, CURLOPT_CUSTOMREQUEST, methodToString(request.method).c_str());
            if (request.body) {
                curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body->size()));
                curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, request.body->c_str());
            } else {
                curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE, 0L);
                curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, "");
            }
            break;
        case HttpMethod::DELETE:
            curl_easy_setopt(handle_, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }

    CURLcode rc = curl_easy_perform(handle_);
    if (rc != CURLE_OK) {
        throw utils::TransportException(curl_easy_strerror(rc), request.url);
    }

    long status = 0;
    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status);
    response.statusCode = static_cast<int>(status);
    return response;
}

} // namespace http
} // namespace loadpulse
