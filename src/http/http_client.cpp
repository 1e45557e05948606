#include "http/http_client.hpp"

namespace loadpulse {
namespace http {

std::string methodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
    }
    return "GET";
}

bool parseMethod(const std::string& name, HttpMethod& method) {
    if (name == "GET") {
        method = HttpMethod::GET;
    } else if (name == "POST") {
        method = HttpMethod::POST;
    } else if (name == "PUT") {
        method = HttpMethod::PUT;
    } else if (name == "DELETE") {
        method = HttpMethod::DELETE;
    } else {
        return false;
    }
    return true;
}

bool methodHasBody(HttpMethod method) {
    return method == HttpMethod::POST || method == HttpMethod::PUT;
}

} // namespace http
} // namespace loadpulse
