#pragma once

#include "core/outcome_recorder.hpp"
#include "http/http_client.hpp"
#include "utils/config.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace loadpulse {
namespace core {

/**
 * Orchestrates one load test: starts the workers, lets them run for the
 * configured wall-clock duration, stops them and hands back the outcomes.
 *
 * Every run gets its own rate limiter and recorder, nothing carries over
 * from a previous run on the same controller.
 */
class RunController {
public:
    /**
     * @throws utils::InvalidConfigurationException if the configuration is
     *         invalid; nothing is started
     */
    RunController(const utils::LoadTestConfig& config, http::HttpClientFactory clientFactory);

    RunController(const RunController&) = delete;
    RunController& operator=(const RunController&) = delete;

    /**
     * Run with the configured duration and concurrency
     * @return the finalized outcomes; no worker touches them afterwards
     */
    std::shared_ptr<OutcomeRecorder> run();

    /**
     * Run with an explicit duration and worker count.
     * Individual request failures never make this throw.
     * @throws utils::InvalidConfigurationException for a non-positive
     *         duration or concurrency, before any worker starts
     * @throws utils::DispatchException if a run is already in progress or
     *         the HTTP clients cannot be created
     */
    std::shared_ptr<OutcomeRecorder> run(double durationSeconds, int concurrency);

    /**
     * End the run in progress early; workers are stopped and joined as if
     * the duration had elapsed. No effect when idle.
     */
    void cancel();

    bool isRunning() const { return running_; }

    double targetRequestCount() const { return config_.targetRequestCount(); }

    const utils::LoadTestConfig& getConfig() const { return config_; }

private:
    http::HttpRequest buildRequest() const;

    /**
     * Sleep until the deadline or cancel(), logging progress once a second
     */
    void waitForDeadline(double durationSeconds, const std::function<size_t()>& completed);

    utils::LoadTestConfig config_;
    http::HttpClientFactory client_factory_;

    std::atomic<bool> running_;
    bool cancelled_;
    std::mutex mutex_;
    std::condition_variable cancel_cv_;
};

} // namespace core
} // namespace loadpulse
