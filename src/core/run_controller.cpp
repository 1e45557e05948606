#include "core/run_controller.hpp"
#include "core/dispatcher.hpp"
#include "core/rate_limiter.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace loadpulse {
namespace core {

namespace {

// Clears the running flag however run() exits
class RunningGuard {
public:
    explicit RunningGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~RunningGuard() { flag_ = false; }

    RunningGuard(const RunningGuard&) = delete;
    RunningGuard& operator=(const RunningGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

RunController::RunController(const utils::LoadTestConfig& config,
                             http::HttpClientFactory clientFactory)
    : config_(config)
    , client_factory_(std::move(clientFactory))
    , running_(false)
    , cancelled_(false) {
    utils::ConfigManager::requireValid(config_);
    if (!client_factory_) {
        throw utils::InvalidConfigurationException("An HTTP client factory is required");
    }
}

std::shared_ptr<OutcomeRecorder> RunController::run() {
    return run(config_.durationSeconds, config_.concurrency);
}

std::shared_ptr<OutcomeRecorder> RunController::run(double durationSeconds, int concurrency) {
    if (!(durationSeconds > 0.0 && durationSeconds <= utils::kMaxDurationSeconds)) {
        throw utils::InvalidConfigurationException("Duration must be positive and at most " +
                                                   std::to_string(utils::kMaxDurationSeconds) + " seconds",
                                                   "duration=" + std::to_string(durationSeconds));
    }
    if (concurrency < 1 || concurrency > utils::kMaxConcurrency) {
        throw utils::InvalidConfigurationException("Concurrency must be between 1 and " +
                                                   std::to_string(utils::kMaxConcurrency),
                                                   "concurrency=" + std::to_string(concurrency));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            throw utils::DispatchException("A run is already in progress");
        }
        running_ = true;
        cancelled_ = false;
    }
    RunningGuard guard(running_);

    auto rateLimiter = std::make_shared<RateLimiter>(config_.qps);
    auto recorder = std::make_shared<OutcomeRecorder>();

    Dispatcher dispatcher(rateLimiter, recorder, buildRequest(), config_.expectedStatusCode,
                          client_factory_, static_cast<size_t>(concurrency));

    std::ostringstream banner;
    banner << "Starting load test: " << config_.method << " " << config_.url
           << " at " << config_.qps << " req/s for " << durationSeconds << "s with "
           << concurrency << " worker(s)";
    utils::Logger::info(banner.str());

    auto started = std::chrono::steady_clock::now();
    dispatcher.start();

    waitForDeadline(durationSeconds, [&dispatcher]() { return dispatcher.getCompletedRequests(); });

    dispatcher.requestStop();
    if (dispatcher.getActiveRequests() > 0) {
        utils::Logger::debug("Waiting for " + std::to_string(dispatcher.getActiveRequests()) +
                             " in-flight request(s)");
    }
    dispatcher.join();

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    std::ostringstream done;
    done << std::fixed << std::setprecision(2)
         << "Load test finished after " << elapsed << "s: "
         << recorder->getTotalCount() << " requests, "
         << recorder->getSuccessCount() << " succeeded, "
         << recorder->getStatusMismatchCount() << " unexpected status, "
         << recorder->getTransportErrorCount() << " transport errors";
    utils::Logger::info(done.str());

    return recorder;
}

void RunController::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        cancelled_ = true;
    }
    cancel_cv_.notify_all();
}

http::HttpRequest RunController::buildRequest() const {
    http::HttpRequest request;
    request.method = config_.getMethod();
    request.url = config_.url;
    request.headers = config_.headers;
    request.timeoutSeconds = config_.timeoutSeconds;
    if (http::methodHasBody(request.method)) {
        request.body = config_.body;
    }
    return request;
}

void RunController::waitForDeadline(double durationSeconds, const std::function<size_t()>& completed) {
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                       std::chrono::duration<double>(durationSeconds));
    // Progress target for this run's duration, which may differ from the config's
    double target = std::round(config_.qps * durationSeconds);

    std::unique_lock<std::mutex> lock(mutex_);
    while (!cancelled_) {
        auto now = Clock::now();
        if (now >= deadline) {
            break;
        }

        auto wake = config_.progressEnabled ? std::min(deadline, now + std::chrono::seconds(1)) : deadline;
        cancel_cv_.wait_until(lock, wake, [this] { return cancelled_; });

        if (config_.progressEnabled && !cancelled_ && Clock::now() < deadline) {
            std::ostringstream progress;
            progress << "Processing requests: " << completed() << "/" << static_cast<long long>(target);
            utils::Logger::info(progress.str());
        }
    }

    if (cancelled_) {
        utils::Logger::warn("Load test cancelled before the configured duration");
    }
}

} // namespace core
} // namespace loadpulse
