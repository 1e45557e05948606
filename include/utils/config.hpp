#pragma once

#include "http/http_client.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace loadpulse {
namespace utils {

// Limits keep every derived interval representable in steady_clock ticks
// and the transport timeout representable in milliseconds
constexpr double kMinQps = 0.001;
constexpr double kMaxQps = 1000000.0;
constexpr double kMaxDurationSeconds = 10000000.0;
constexpr double kMaxTimeoutSeconds = 1000000.0;
constexpr int kMaxConcurrency = 10000;

/**
 * Everything needed to run one load test
 */
struct LoadTestConfig {
    // Target
    std::string url;
    std::string method = "GET";
    http::HeaderMap headers;
    std::optional<std::string> body;
    int expectedStatusCode = 200;

    // Load shape
    double qps = 0.0;
    double durationSeconds = 60.0;
    int concurrency = 1;
    double timeoutSeconds = 5.0;

    // Output
    bool verbose = true;
    std::string outputPath = "test_report";
    bool latencyCsvEnabled = false;
    bool progressEnabled = true;
    std::string logLevel = "INFO";

    /**
     * Informational request count for progress display, not a ceiling
     */
    double targetRequestCount() const { return qps * durationSeconds; }

    /**
     * Parsed method; only meaningful for a validated configuration
     */
    http::HttpMethod getMethod() const;
};

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    void merge(const ConfigValidationResult& other);

    bool hasErrors() const { return !errors.empty(); }
    bool hasWarnings() const { return !warnings.empty(); }
};

/**
 * Load test configuration manager.
 * Loads and exports JSON, validates before accepting any change.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /**
     * Load configuration from a JSON file
     * @param configPath Path to configuration file
     * @param validate Reject an invalid result; pass false when more
     *                 settings are layered on top before the run
     * @return true if the file was parsed (and valid when requested)
     */
    bool loadFromFile(const std::string& configPath, bool validate = true);

    /**
     * Save the current configuration as JSON
     * @return true if written successfully
     */
    bool saveToFile(const std::string& configPath) const;

    /**
     * Load configuration from a JSON string. Keys missing from the
     * document keep their current values.
     * @return true if parsed (and valid when requested)
     */
    bool loadFromJson(const std::string& jsonStr, bool validate = true);

    std::string exportToJson() const;

    LoadTestConfig getConfig() const;

    /**
     * Replace the configuration if it validates
     * @return Validation result; the stored config is unchanged on errors
     */
    ConfigValidationResult updateConfig(const LoadTestConfig& newConfig);

    ConfigValidationResult validateConfig(const LoadTestConfig& config) const;

    /**
     * Validate and throw InvalidConfigurationException listing every error.
     * Warnings are logged.
     */
    static void requireValid(const LoadTestConfig& config);

    /**
     * Fill in the request defaults used when nothing was given:
     * a JSON content type header and, for POST/PUT, an example body.
     */
    static void applyRequestDefaults(LoadTestConfig& config);

private:
    bool parseJsonConfig(const std::string& jsonStr, LoadTestConfig& config) const;
    std::string configToJson(const LoadTestConfig& config) const;

    ConfigValidationResult validateTargetConfig(const LoadTestConfig& config) const;
    ConfigValidationResult validateLoadConfig(const LoadTestConfig& config) const;
    ConfigValidationResult validateOutputConfig(const LoadTestConfig& config) const;

    LoadTestConfig config_;
    mutable std::mutex configMutex_;
};

} // namespace utils
} // namespace loadpulse
