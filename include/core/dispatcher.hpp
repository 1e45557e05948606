#pragma once

#include "core/outcome_recorder.hpp"
#include "core/rate_limiter.hpp"
#include "http/http_client.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace loadpulse {
namespace core {

/**
 * Fixed pool of worker threads issuing rate-limited requests.
 *
 * Each worker loops: acquire a token, send one request through its own
 * HttpClient, record the outcome. Failures are recorded and never end a
 * worker. The stop flag is checked once per iteration, so a request in
 * flight always completes; a request that never returns keeps its worker
 * (and join()) waiting until the client's timeout fires.
 */
class Dispatcher {
public:
    /**
     * @param rateLimiter Shared admission gate
     * @param recorder Shared outcome sink
     * @param request Request issued by every iteration; the body is dropped
     *                for methods other than POST and PUT
     * @param expectedStatus Status counted as success
     * @param clientFactory Called once per worker on start()
     * @param numWorkers Number of worker threads, at least 1
     */
    Dispatcher(std::shared_ptr<RateLimiter> rateLimiter,
               std::shared_ptr<OutcomeRecorder> recorder,
               http::HttpRequest request,
               int expectedStatus,
               http::HttpClientFactory clientFactory,
               size_t numWorkers);
    ~Dispatcher();

    // Non-copyable, non-movable
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    /**
     * Create one client per worker, then launch the workers.
     * @throws utils::DispatchException if a client cannot be created; no
     *         worker is started in that case
     */
    void start();

    /**
     * Signal all workers to stop after their current request.
     * Also wakes workers waiting on the rate limiter.
     */
    void requestStop();

    /**
     * Wait for every worker to exit
     */
    void join();

    void stop() {
        requestStop();
        join();
    }

    bool isRunning() const { return running_; }
    bool isStopRequested() const { return stop_requested_; }
    size_t getNumWorkers() const { return num_workers_; }

    /**
     * Requests currently between send and record
     */
    size_t getActiveRequests() const { return active_requests_; }
    size_t getCompletedRequests() const { return completed_requests_; }

private:
    void workerLoop(size_t index, std::unique_ptr<http::HttpClient> client);

    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<OutcomeRecorder> recorder_;
    http::HttpRequest request_;
    int expected_status_;
    http::HttpClientFactory client_factory_;
    size_t num_workers_;

    std::vector<std::thread> workers_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::atomic<size_t> active_requests_;
    std::atomic<size_t> completed_requests_;
};

} // namespace core
} // namespace loadpulse
