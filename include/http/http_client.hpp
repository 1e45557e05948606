#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace loadpulse {
namespace http {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE
};

std::string methodToString(HttpMethod method);

/**
 * Parse an upper-case method name.
 * @return false for anything outside GET, POST, PUT, DELETE
 */
bool parseMethod(const std::string& name, HttpMethod& method);

/**
 * Only POST and PUT carry a request body
 */
bool methodHasBody(HttpMethod method);

using HeaderMap = std::map<std::string, std::string>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HeaderMap headers;
    std::optional<std::string> body;
    double timeoutSeconds = 5.0;
};

struct HttpResponse {
    int statusCode = 0;
    size_t bodyBytes = 0;
};

/**
 * Issues one request and waits for the full response.
 * Implementations throw utils::TransportException when the request does not
 * complete (connection refused, DNS failure, timeout, ...). Any HTTP status,
 * including 4xx and 5xx, is a completed request.
 * Instances are used by one thread at a time.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * Creates one client per worker thread
 */
using HttpClientFactory = std::function<std::unique_ptr<HttpClient>()>;

} // namespace http
} // namespace loadpulse
