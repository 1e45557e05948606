#include "report/report_writer.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iomanip>

namespace loadpulse {
namespace report {

using json = nlohmann::ordered_json;

ReportWriter::ReportWriter(std::string outputPath, bool verbose, bool latencyCsv)
    : output_path_(std::move(outputPath)), verbose_(verbose), latency_csv_(latencyCsv) {
}

void ReportWriter::write(const core::OutcomeRecorder& recorder, std::ostream& console) const {
    core::RunSummary summary = recorder.summarize();

    if (verbose_) {
        console << toJson(summary) << std::endl;
    }

    if (!output_path_.empty()) {
        writeJsonFile(summary, output_path_);
        utils::Logger::info("Report saved to " + output_path_);
    }

    if (latency_csv_ && !output_path_.empty()) {
        std::string csvPath = latencyCsvPath(output_path_);
        writeLatencyCsv(recorder.latencies(), csvPath);
        utils::Logger::info("Latency samples saved to " + csvPath);
    }
}

std::string ReportWriter::toJson(const core::RunSummary& summary, int indent) {
    json j;
    j["total_requests"] = summary.totalRequests;
    j["successful_requests"] = summary.successfulRequests;
    j["average_latency"] = summary.averageLatency;
    j["error_rate"] = summary.errorRate;
    j["success_rate"] = summary.successRate;
    j["50th_percentile"] = summary.p50;
    j["90th_percentile"] = summary.p90;
    j["95th_percentile"] = summary.p95;
    j["99th_percentile"] = summary.p99;
    return j.dump(indent);
}

void ReportWriter::writeJsonFile(const core::RunSummary& summary, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw utils::ReportException("Failed to open report file for writing", path);
    }

    file << toJson(summary) << '\n';
    file.close();
    if (file.fail()) {
        throw utils::ReportException("Failed to write report file", path);
    }
}

void ReportWriter::writeLatencyCsv(const std::vector<double>& latencies, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw utils::ReportException("Failed to open latency file for writing", path);
    }

    file << "request,latency_seconds\n";
    file << std::setprecision(9);
    for (size_t i = 0; i < latencies.size(); ++i) {
        file << (i + 1) << ',' << latencies[i] << '\n';
    }

    file.close();
    if (file.fail()) {
        throw utils::ReportException("Failed to write latency file", path);
    }
}

std::string ReportWriter::latencyCsvPath(const std::string& outputPath) {
    const std::string suffix = ".json";
    std::string base = outputPath;
    if (base.size() > suffix.size() &&
        base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0) {
        base.erase(base.size() - suffix.size());
    }
    return base + "_latencies.csv";
}

} // namespace report
} // namespace loadpulse
