#include "core/dispatcher.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <chrono>

namespace loadpulse {
namespace core {

namespace {

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

Dispatcher::Dispatcher(std::shared_ptr<RateLimiter> rateLimiter,
                       std::shared_ptr<OutcomeRecorder> recorder,
                       http::HttpRequest request,
                       int expectedStatus,
                       http::HttpClientFactory clientFactory,
                       size_t numWorkers)
    : rate_limiter_(std::move(rateLimiter))
    , recorder_(std::move(recorder))
    , request_(std::move(request))
    , expected_status_(expectedStatus)
    , client_factory_(std::move(clientFactory))
    , num_workers_(numWorkers)
    , running_(false)
    , stop_requested_(false)
    , active_requests_(0)
    , completed_requests_(0) {
    if (!rate_limiter_ || !recorder_ || !client_factory_) {
        throw utils::DispatchException("Dispatcher requires a rate limiter, a recorder and a client factory");
    }
    if (num_workers_ == 0) {
        throw utils::InvalidConfigurationException("Concurrency must be at least 1");
    }
    if (!http::methodHasBody(request_.method)) {
        request_.body.reset();
    }
}

Dispatcher::~Dispatcher() {
    stop();
}

void Dispatcher::start() {
    if (running_ || stop_requested_) {
        return;
    }

    // Build every client up front so a broken factory fails before any request
    std::vector<std::unique_ptr<http::HttpClient>> clients;
    clients.reserve(num_workers_);
    for (size_t i = 0; i < num_workers_; ++i) {
        std::unique_ptr<http::HttpClient> client;
        try {
            client = client_factory_();
        } catch (const std::exception& e) {
            throw utils::DispatchException("Failed to create HTTP client", e.what());
        }
        if (!client) {
            throw utils::DispatchException("HTTP client factory returned no client");
        }
        clients.push_back(std::move(client));
    }

    running_ = true;
    workers_.reserve(num_workers_);
    for (size_t i = 0; i < num_workers_; ++i) {
        workers_.emplace_back(&Dispatcher::workerLoop, this, i, std::move(clients[i]));
    }

    utils::Logger::debug("Dispatcher started " + std::to_string(num_workers_) + " workers");
}

void Dispatcher::requestStop() {
    if (stop_requested_.exchange(true)) {
        return;
    }
    rate_limiter_->cancel();
}

void Dispatcher::join() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers_.clear();
    running_ = false;
}

void Dispatcher::workerLoop(size_t index, std::unique_ptr<http::HttpClient> client) {
    utils::ErrorContext context("worker-" + std::to_string(index));

    while (!stop_requested_) {
        if (!rate_limiter_->acquire()) {
            // Limiter cancelled, the run is over
            break;
        }

        active_requests_++;
        auto start = std::chrono::steady_clock::now();

        try {
            http::HttpResponse response = client->send(request_);
            recorder_->recordResponse(secondsSince(start), response.statusCode, expected_status_);
        } catch (const utils::TransportException& e) {
            recorder_->recordFailure(secondsSince(start), e.what());
            utils::ErrorHandler::getInstance().reportError(e, utils::ErrorContext::getCurrentContext());
        } catch (const std::exception& e) {
            // Anything else out of the client is still a request that did not complete
            double latency = secondsSince(start);
            recorder_->recordFailure(latency, e.what());
            utils::ErrorHandler::getInstance().reportError(
                utils::ErrorInfo(utils::ErrorCategory::TRANSPORT, utils::ErrorSeverity::WARNING,
                                 e.what(), request_.url, utils::ErrorContext::getCurrentContext()));
        }

        active_requests_--;
        completed_requests_++;
    }

    utils::Logger::debug("Worker " + std::to_string(index) + " stopped");
}

} // namespace core
} // namespace loadpulse
