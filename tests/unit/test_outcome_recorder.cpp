#include "core/outcome_recorder.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace loadpulse::core;

class OutcomeRecorderTest : public ::testing::Test {
protected:
    OutcomeRecorder recorder;
};

TEST_F(OutcomeRecorderTest, ClassifiesMatchingStatusAsSuccess) {
    EXPECT_EQ(recorder.record(0.1, 200, 200), OutcomeKind::SUCCESS);
    EXPECT_EQ(recorder.getSuccessCount(), 1u);
    EXPECT_EQ(recorder.getErrorCount(), 0u);
}

TEST_F(OutcomeRecorderTest, ClassifiesOtherStatusAsMismatch) {
    EXPECT_EQ(recorder.record(0.2, 404, 200), OutcomeKind::STATUS_MISMATCH);
    EXPECT_EQ(recorder.getStatusMismatchCount(), 1u);
    EXPECT_EQ(recorder.getErrorCount(), 1u);
}

TEST_F(OutcomeRecorderTest, ErrorWinsOverStatus) {
    EXPECT_EQ(recorder.record(0.05, 200, 200, "timeout"), OutcomeKind::TRANSPORT_ERROR);
    EXPECT_EQ(recorder.recordFailure(0.05, "timeout"), OutcomeKind::TRANSPORT_ERROR);
    EXPECT_EQ(recorder.getTransportErrorCount(), 2u);
    EXPECT_EQ(recorder.getSuccessCount(), 0u);

    auto outcomes = recorder.getOutcomes();
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].error, "timeout");
    EXPECT_EQ(outcomes[0].statusCode, 0);
}

TEST_F(OutcomeRecorderTest, FailureWithoutMessageIsStillTransportError) {
    EXPECT_EQ(recorder.recordFailure(0.01, ""), OutcomeKind::TRANSPORT_ERROR);
    EXPECT_FALSE(recorder.getOutcomes()[0].error.empty());
}

TEST_F(OutcomeRecorderTest, NegativeLatencyIsClampedToZero) {
    recorder.recordResponse(-0.5, 200, 200);
    EXPECT_DOUBLE_EQ(recorder.latencies()[0], 0.0);
}

TEST_F(OutcomeRecorderTest, KeepsCompletionOrder) {
    recorder.recordResponse(0.3, 200, 200);
    recorder.recordResponse(0.1, 500, 200);
    recorder.recordFailure(0.2, "refused");

    std::vector<double> expected{0.3, 0.1, 0.2};
    EXPECT_EQ(recorder.latencies(), expected);

    auto outcomes = recorder.getOutcomes();
    EXPECT_EQ(outcomes[1].kind, OutcomeKind::STATUS_MISMATCH);
    EXPECT_EQ(outcomes[1].statusCode, 500);
}

TEST_F(OutcomeRecorderTest, EmptySummaryIsAllZero) {
    RunSummary summary = recorder.summarize();
    EXPECT_EQ(summary.totalRequests, 0u);
    EXPECT_EQ(summary.successfulRequests, 0u);
    EXPECT_DOUBLE_EQ(summary.averageLatency, 0.0);
    EXPECT_DOUBLE_EQ(summary.errorRate, 0.0);
    EXPECT_DOUBLE_EQ(summary.successRate, 0.0);
    EXPECT_DOUBLE_EQ(summary.p50, 0.0);
    EXPECT_DOUBLE_EQ(summary.p90, 0.0);
    EXPECT_DOUBLE_EQ(summary.p95, 0.0);
    EXPECT_DOUBLE_EQ(summary.p99, 0.0);
}

TEST_F(OutcomeRecorderTest, SummaryRatesAndAverage) {
    recorder.recordResponse(0.1, 200, 200);
    recorder.recordResponse(0.2, 200, 200);
    recorder.recordResponse(0.3, 404, 200);
    recorder.recordFailure(0.4, "reset");

    RunSummary summary = recorder.summarize();
    EXPECT_EQ(summary.totalRequests, 4u);
    EXPECT_EQ(summary.successfulRequests, 2u);
    EXPECT_NEAR(summary.averageLatency, 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(summary.successRate, 0.5);
    EXPECT_DOUBLE_EQ(summary.errorRate, 0.5);
}

TEST_F(OutcomeRecorderTest, AllFailuresStillSummarize) {
    recorder.recordFailure(0.5, "refused");
    recorder.recordFailure(1.5, "refused");

    RunSummary summary = recorder.summarize();
    EXPECT_EQ(summary.totalRequests, 2u);
    EXPECT_DOUBLE_EQ(summary.successRate, 0.0);
    EXPECT_DOUBLE_EQ(summary.errorRate, 1.0);
    EXPECT_DOUBLE_EQ(summary.p50, 0.5);
    EXPECT_DOUBLE_EQ(summary.p99, 1.5);
}

TEST(PercentileTest, NearestRankOnFiveSamples) {
    std::vector<double> values{0.5, 0.1, 0.4, 0.2, 0.3};
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile(values, 50), 0.3);
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile(values, 90), 0.5);
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile(values, 99), 0.5);
}

TEST(PercentileTest, NearestRankOnFourSamples) {
    std::vector<double> values{0.1, 0.2, 0.3, 0.4};
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile(values, 50), 0.2);
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile(values, 95), 0.4);
}

TEST(PercentileTest, SmallSamplesClampToFirstIndex) {
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile({0.7}, 50), 0.7);
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile({0.7}, 1), 0.7);
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile({0.9, 0.3}, 1), 0.3);
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile({}, 50), 0.0);
}

TEST(PercentileTest, InputIsNotReordered) {
    const std::vector<double> unsorted{0.4, 0.1, 0.3, 0.2};
    const std::vector<double> copy = unsorted;

    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile(unsorted, 50), 0.2);
    EXPECT_EQ(unsorted, copy);

    const std::vector<double> sorted{0.1, 0.2, 0.3, 0.4};
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile(sorted, 50), 0.2);
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile(sorted, 99), 0.4);
}

TEST(PercentileTest, HundredSamples) {
    std::vector<double> values;
    for (int i = 100; i >= 1; --i) {
        values.push_back(i / 1000.0);
    }
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile(values, 50), 0.050);
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile(values, 90), 0.090);
    EXPECT_DOUBLE_EQ(OutcomeRecorder::percentile(values, 99), 0.099);
}

TEST_F(OutcomeRecorderTest, CountersConsistentUnderConcurrentRecording) {
    const int threads = 8;
    const int perThread = 500;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this, t]() {
            for (int i = 0; i < perThread; ++i) {
                switch ((t + i) % 3) {
                    case 0: recorder.recordResponse(0.01, 200, 200); break;
                    case 1: recorder.recordResponse(0.02, 503, 200); break;
                    default: recorder.recordFailure(0.03, "timeout"); break;
                }
            }
        });
    }

    // Observe while recording is in progress
    for (int i = 0; i < 50; ++i) {
        RunSummary summary = recorder.summarize();
        EXPECT_LE(summary.successfulRequests, summary.totalRequests);
    }

    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(recorder.getTotalCount(), static_cast<size_t>(threads * perThread));
    EXPECT_EQ(recorder.getTotalCount(), recorder.getSuccessCount() + recorder.getErrorCount());
    EXPECT_EQ(recorder.getErrorCount(),
              recorder.getStatusMismatchCount() + recorder.getTransportErrorCount());
    EXPECT_EQ(recorder.getOutcomes().size(), recorder.getTotalCount());
}
