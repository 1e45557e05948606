#pragma once

#include "core/outcome_recorder.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace loadpulse {
namespace report {

/**
 * Serializes finalized run statistics.
 *
 * JSON keys: total_requests, successful_requests, average_latency,
 * error_rate, success_rate, 50th_percentile, 90th_percentile,
 * 95th_percentile, 99th_percentile.
 */
class ReportWriter {
public:
    /**
     * @param outputPath JSON report path, empty to skip the file
     * @param verbose Print the JSON report to the console stream
     * @param latencyCsv Also dump per-request latencies next to the report
     */
    ReportWriter(std::string outputPath, bool verbose, bool latencyCsv = false);

    /**
     * Write everything enabled for this writer.
     * @throws utils::ReportException if a file cannot be written
     */
    void write(const core::OutcomeRecorder& recorder, std::ostream& console) const;

    static std::string toJson(const core::RunSummary& summary, int indent = 4);

    /**
     * @throws utils::ReportException
     */
    static void writeJsonFile(const core::RunSummary& summary, const std::string& path);

    /**
     * Latencies in completion order, one row per request:
     * request,latency_seconds
     * @throws utils::ReportException
     */
    static void writeLatencyCsv(const std::vector<double>& latencies, const std::string& path);

    /**
     * "<output>_latencies.csv", with a trailing .json stripped first
     */
    static std::string latencyCsvPath(const std::string& outputPath);

private:
    std::string output_path_;
    bool verbose_;
    bool latency_csv_;
};

} // namespace report
} // namespace loadpulse
