#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace loadpulse {
namespace core {

enum class OutcomeKind {
    SUCCESS,
    STATUS_MISMATCH,
    TRANSPORT_ERROR
};

std::string outcomeKindToString(OutcomeKind kind);

/**
 * Result of one completed request attempt
 */
struct Outcome {
    double latencySeconds = 0.0;
    OutcomeKind kind = OutcomeKind::SUCCESS;
    int statusCode = 0;
    std::string error;
};

/**
 * Finalized statistics handed to reporting
 */
struct RunSummary {
    size_t totalRequests = 0;
    size_t successfulRequests = 0;
    double averageLatency = 0.0;
    double errorRate = 0.0;
    double successRate = 0.0;
    double p50 = 0.0;
    double p90 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
};

/**
 * Thread-safe sink for per-request outcomes.
 * Outcomes are kept in completion order. The counters always satisfy
 * total == success + error == number of outcomes.
 */
class OutcomeRecorder {
public:
    OutcomeRecorder() = default;

    OutcomeRecorder(const OutcomeRecorder&) = delete;
    OutcomeRecorder& operator=(const OutcomeRecorder&) = delete;

    /**
     * Classify and append one outcome.
     * A non-empty error means the request did not complete and wins over
     * the status comparison.
     * @param latencySeconds Issue-to-completion time, negative values clamp to 0
     * @param statusCode Response status, ignored when error is set
     * @param expectedStatus Status counted as success
     * @param error Transport failure description, empty for a completed request
     * @return the recorded classification
     */
    OutcomeKind record(double latencySeconds, int statusCode, int expectedStatus,
                       const std::string& error = "");

    OutcomeKind recordResponse(double latencySeconds, int statusCode, int expectedStatus);
    OutcomeKind recordFailure(double latencySeconds, const std::string& error);

    size_t getTotalCount() const;
    size_t getSuccessCount() const;
    size_t getErrorCount() const;
    size_t getStatusMismatchCount() const;
    size_t getTransportErrorCount() const;

    std::vector<Outcome> getOutcomes() const;

    /**
     * Latencies in completion order
     */
    std::vector<double> latencies() const;

    RunSummary summarize() const;

    /**
     * Nearest-rank percentile: index ceil(size * p / 100) - 1 into the
     * sorted values, clamped into range. Returns 0 for no values.
     * Unsorted input is sorted in a copy; sorted input is indexed in place.
     */
    static double percentile(const std::vector<double>& values, double p);

private:
    std::vector<Outcome> outcomes_;
    size_t total_count_ = 0;
    size_t success_count_ = 0;
    size_t error_count_ = 0;
    size_t mismatch_count_ = 0;
    size_t transport_error_count_ = 0;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace loadpulse
