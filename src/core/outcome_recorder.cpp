#include "core/outcome_recorder.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace loadpulse {
namespace core {

std::string outcomeKindToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::SUCCESS: return "Success";
        case OutcomeKind::STATUS_MISMATCH: return "StatusMismatch";
        case OutcomeKind::TRANSPORT_ERROR: return "TransportError";
    }
    return "Unknown";
}

OutcomeKind OutcomeRecorder::record(double latencySeconds, int statusCode, int expectedStatus,
                                    const std::string& error) {
    Outcome outcome;
    outcome.latencySeconds = std::max(0.0, latencySeconds);
    outcome.statusCode = statusCode;
    outcome.error = error;

    if (!error.empty()) {
        outcome.kind = OutcomeKind::TRANSPORT_ERROR;
        outcome.statusCode = 0;
    } else if (statusCode == expectedStatus) {
        outcome.kind = OutcomeKind::SUCCESS;
    } else {
        outcome.kind = OutcomeKind::STATUS_MISMATCH;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    switch (outcome.kind) {
        case OutcomeKind::SUCCESS:
            success_count_++;
            break;
        case OutcomeKind::STATUS_MISMATCH:
            mismatch_count_++;
            error_count_++;
            break;
        case OutcomeKind::TRANSPORT_ERROR:
            transport_error_count_++;
            error_count_++;
            break;
    }
    total_count_++;
    outcomes_.push_back(std::move(outcome));
    return outcomes_.back().kind;
}

OutcomeKind OutcomeRecorder::recordResponse(double latencySeconds, int statusCode, int expectedStatus) {
    return record(latencySeconds, statusCode, expectedStatus);
}

OutcomeKind OutcomeRecorder::recordFailure(double latencySeconds, const std::string& error) {
    // An empty message would otherwise classify as a response
    return record(latencySeconds, 0, 0, error.empty() ? "unknown transport error" : error);
}

size_t OutcomeRecorder::getTotalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_count_;
}

size_t OutcomeRecorder::getSuccessCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return success_count_;
}

size_t OutcomeRecorder::getErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_count_;
}

size_t OutcomeRecorder::getStatusMismatchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mismatch_count_;
}

size_t OutcomeRecorder::getTransportErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_error_count_;
}

std::vector<Outcome> OutcomeRecorder::getOutcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

std::vector<double> OutcomeRecorder::latencies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<double> values;
    values.reserve(outcomes_.size());
    for (const auto& outcome : outcomes_) {
        values.push_back(outcome.latencySeconds);
    }
    return values;
}

RunSummary OutcomeRecorder::summarize() const {
    RunSummary summary;
    size_t success = 0;
    size_t errors = 0;
    std::vector<double> values;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        summary.totalRequests = total_count_;
        success = success_count_;
        errors = error_count_;
        values.reserve(outcomes_.size());
        for (const auto& outcome : outcomes_) {
            values.push_back(outcome.latencySeconds);
        }
    }

    summary.successfulRequests = success;
    if (summary.totalRequests == 0) {
        return summary;
    }

    double total = static_cast<double>(summary.totalRequests);
    summary.averageLatency = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    summary.errorRate = errors / total;
    summary.successRate = success / total;

    std::sort(values.begin(), values.end());
    summary.p50 = percentile(values, 50);
    summary.p90 = percentile(values, 90);
    summary.p95 = percentile(values, 95);
    summary.p99 = percentile(values, 99);
    return summary;
}

double OutcomeRecorder::percentile(const std::vector<double>& values, double p) {
    if (values.empty()) {
        return 0.0;
    }

    if (!std::is_sorted(values.begin(), values.end())) {
        std::vector<double> sorted(values);
        std::sort(sorted.begin(), sorted.end());
        return percentile(sorted, p);
    }

    auto n = static_cast<long long>(values.size());
    auto index = static_cast<long long>(std::ceil(n * p / 100.0)) - 1;
    index = std::max(0LL, std::min(index, n - 1));
    return values[static_cast<size_t>(index)];
}

} // namespace core
} // namespace loadpulse
