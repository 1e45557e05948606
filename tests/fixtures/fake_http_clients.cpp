#include "fixtures/fake_http_clients.hpp"
#include "utils/error_handler.hpp"
#include <thread>

namespace fixtures {

using loadpulse::http::HttpClient;
using loadpulse::http::HttpClientFactory;
using loadpulse::http::HttpRequest;
using loadpulse::http::HttpResponse;

FixedStatusClient::FixedStatusClient(int status, std::chrono::milliseconds delay)
    : status_(status), delay_(delay) {
}

HttpResponse FixedStatusClient::send(const HttpRequest&) {
    if (delay_.count() > 0) {
        std::this_thread::sleep_for(delay_);
    }
    HttpResponse response;
    response.statusCode = status_;
    response.bodyBytes = 2;
    return response;
}

FailingClient::FailingClient(std::string message, std::chrono::milliseconds delay)
    : message_(std::move(message)), delay_(delay) {
}

HttpResponse FailingClient::send(const HttpRequest& request) {
    if (delay_.count() > 0) {
        std::this_thread::sleep_for(delay_);
    }
    throw loadpulse::utils::TransportException(message_, request.url);
}

void RequestLog::add(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex);
    requests.push_back(request);
}

size_t RequestLog::size() {
    std::lock_guard<std::mutex> lock(mutex);
    return requests.size();
}

RecordingClient::RecordingClient(std::shared_ptr<RequestLog> log, int status,
                                 std::chrono::milliseconds delay)
    : log_(std::move(log)), status_(status), delay_(delay) {
}

HttpResponse RecordingClient::send(const HttpRequest& request) {
    size_t now = ++log_->inFlight;
    size_t seen = log_->maxInFlight.load();
    while (now > seen && !log_->maxInFlight.compare_exchange_weak(seen, now)) {
    }

    log_->add(request);
    if (delay_.count() > 0) {
        std::this_thread::sleep_for(delay_);
    }

    --log_->inFlight;
    HttpResponse response;
    response.statusCode = status_;
    return response;
}

HttpClientFactory fixedStatusFactory(int status, std::chrono::milliseconds delay) {
    return [status, delay]() -> std::unique_ptr<HttpClient> {
        return std::make_unique<FixedStatusClient>(status, delay);
    };
}

HttpClientFactory failingFactory(const std::string& message, std::chrono::milliseconds delay) {
    return [message, delay]() -> std::unique_ptr<HttpClient> {
        return std::make_unique<FailingClient>(message, delay);
    };
}

HttpClientFactory recordingFactory(std::shared_ptr<RequestLog> log, int status,
                                   std::chrono::milliseconds delay) {
    return [log, status, delay]() -> std::unique_ptr<HttpClient> {
        log->clientsCreated++;
        return std::make_unique<RecordingClient>(log, status, delay);
    };
}

} // namespace fixtures
