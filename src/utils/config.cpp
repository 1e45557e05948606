#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <sstream>

namespace loadpulse {
namespace utils {

using json = nlohmann::json;

namespace {

const char* kDefaultBody = R"({"example_key": "example_value"})";

bool isPositiveFinite(double value) {
    return value > 0.0 && std::isfinite(value);
}

} // namespace

http::HttpMethod LoadTestConfig::getMethod() const {
    http::HttpMethod parsed = http::HttpMethod::GET;
    http::parseMethod(method, parsed);
    return parsed;
}

void ConfigValidationResult::merge(const ConfigValidationResult& other) {
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    isValid = errors.empty();
}

bool ConfigManager::loadFromFile(const std::string& configPath, bool validate) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        Logger::error("Failed to open configuration file: " + configPath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!loadFromJson(buffer.str(), validate)) {
        Logger::error("Failed to load configuration file: " + configPath);
        return false;
    }

    Logger::info("Configuration loaded from: " + configPath);
    return true;
}

bool ConfigManager::saveToFile(const std::string& configPath) const {
    std::string jsonStr = exportToJson();

    std::ofstream file(configPath);
    if (!file.is_open()) {
        Logger::error("Failed to open configuration file for writing: " + configPath);
        return false;
    }

    file << jsonStr << '\n';
    file.close();

    if (file.fail()) {
        Logger::error("Failed to write configuration file: " + configPath);
        return false;
    }
    return true;
}

bool ConfigManager::loadFromJson(const std::string& jsonStr, bool validate) {
    std::lock_guard<std::mutex> lock(configMutex_);

    LoadTestConfig newConfig = config_;
    if (!parseJsonConfig(jsonStr, newConfig)) {
        return false;
    }

    if (!validate) {
        config_ = newConfig;
        return true;
    }

    auto validationResult = validateConfig(newConfig);
    if (!validationResult.isValid) {
        Logger::error("Invalid configuration");
        for (const auto& error : validationResult.errors) {
            Logger::error("  " + error);
        }
        return false;
    }

    for (const auto& warning : validationResult.warnings) {
        Logger::warn("  " + warning);
    }

    config_ = newConfig;
    return true;
}

std::string ConfigManager::exportToJson() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return configToJson(config_);
}

LoadTestConfig ConfigManager::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

ConfigValidationResult ConfigManager::updateConfig(const LoadTestConfig& newConfig) {
    std::lock_guard<std::mutex> lock(configMutex_);

    auto validationResult = validateConfig(newConfig);
    if (validationResult.isValid) {
        config_ = newConfig;
    }
    return validationResult;
}

ConfigValidationResult ConfigManager::validateConfig(const LoadTestConfig& config) const {
    ConfigValidationResult result;
    result.merge(validateTargetConfig(config));
    result.merge(validateLoadConfig(config));
    result.merge(validateOutputConfig(config));
    return result;
}

void ConfigManager::requireValid(const LoadTestConfig& config) {
    ConfigManager validator;
    auto result = validator.validateConfig(config);

    for (const auto& warning : result.warnings) {
        Logger::warn("Configuration: " + warning);
    }

    if (!result.isValid) {
        std::string details;
        for (const auto& error : result.errors) {
            if (!details.empty()) {
                details += "; ";
            }
            details += error;
        }
        throw InvalidConfigurationException("Invalid load test configuration", details);
    }
}

void ConfigManager::applyRequestDefaults(LoadTestConfig& config) {
    if (config.headers.empty()) {
        config.headers["Content-Type"] = "application/json";
    }

    http::HttpMethod method;
    if (!config.body && http::parseMethod(config.method, method) && http::methodHasBody(method)) {
        config.body = kDefaultBody;
    }
}

ConfigValidationResult ConfigManager::validateTargetConfig(const LoadTestConfig& config) const {
    ConfigValidationResult result;

    if (config.url.empty()) {
        result.addError("URL must not be empty");
    } else if (config.url.rfind("http://", 0) != 0 && config.url.rfind("https://", 0) != 0) {
        result.addError("URL must start with http:// or https://: " + config.url);
    }

    http::HttpMethod method;
    if (!http::parseMethod(config.method, method)) {
        result.addError("Unsupported HTTP method: " + config.method +
                        " (expected GET, POST, PUT or DELETE)");
    } else if (config.body && !http::methodHasBody(method)) {
        result.addWarning("Request body is ignored for " + config.method + " requests");
    }

    if (config.expectedStatusCode < 100 || config.expectedStatusCode > 599) {
        result.addError("Expected status code must be between 100 and 599");
    }

    for (const auto& header : config.headers) {
        if (header.first.empty()) {
            result.addError("Header names must not be empty");
            break;
        }
    }

    return result;
}

ConfigValidationResult ConfigManager::validateLoadConfig(const LoadTestConfig& config) const {
    ConfigValidationResult result;

    if (!isPositiveFinite(config.qps)) {
        result.addError("QPS must be positive");
    } else if (config.qps < kMinQps || config.qps > kMaxQps) {
        result.addError("QPS must be between " + std::to_string(kMinQps) + " and " +
                        std::to_string(kMaxQps));
    }

    if (!isPositiveFinite(config.durationSeconds)) {
        result.addError("Duration must be positive");
    } else if (config.durationSeconds > kMaxDurationSeconds) {
        result.addError("Duration must not exceed " + std::to_string(kMaxDurationSeconds) + " seconds");
    }

    if (config.concurrency < 1) {
        result.addError("Concurrency must be at least 1");
    } else if (config.concurrency > kMaxConcurrency) {
        result.addError("Concurrency must not exceed " + std::to_string(kMaxConcurrency));
    }

    if (!isPositiveFinite(config.timeoutSeconds)) {
        result.addError("Timeout must be positive");
    } else if (config.timeoutSeconds > kMaxTimeoutSeconds) {
        result.addError("Timeout must not exceed " + std::to_string(kMaxTimeoutSeconds) + " seconds");
    }

    if (result.isValid) {
        if (config.concurrency > config.targetRequestCount()) {
            result.addWarning("Concurrency exceeds the target request count, some workers will stay idle");
        }
        if (config.timeoutSeconds > config.durationSeconds) {
            result.addWarning("Timeout is longer than the run duration, a hung request can delay shutdown");
        }
    }

    return result;
}

ConfigValidationResult ConfigManager::validateOutputConfig(const LoadTestConfig& config) const {
    ConfigValidationResult result;

    LogLevel level;
    if (!Logger::parseLevel(config.logLevel, level)) {
        result.addError("Unknown log level: " + config.logLevel);
    }

    if (config.latencyCsvEnabled && config.outputPath.empty()) {
        result.addError("Latency CSV requires an output path");
    }

    return result;
}

bool ConfigManager::parseJsonConfig(const std::string& jsonStr, LoadTestConfig& config) const {
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            Logger::error("Configuration root must be a JSON object");
            return false;
        }

        config.url = j.value("url", config.url);
        config.method = j.value("method", config.method);
        config.qps = j.value("qps", config.qps);
        config.durationSeconds = j.value("duration", config.durationSeconds);
        config.concurrency = j.value("concurrency", config.concurrency);
        config.timeoutSeconds = j.value("timeout", config.timeoutSeconds);
        config.expectedStatusCode = j.value("expected_status", config.expectedStatusCode);
        config.verbose = j.value("verbose", config.verbose);
        config.outputPath = j.value("output", config.outputPath);
        config.latencyCsvEnabled = j.value("latency_csv", config.latencyCsvEnabled);
        config.progressEnabled = j.value("progress", config.progressEnabled);
        config.logLevel = j.value("log_level", config.logLevel);

        if (j.contains("headers")) {
            config.headers.clear();
            for (const auto& item : j.at("headers").items()) {
                config.headers[item.key()] = item.value().get<std::string>();
            }
        }

        if (j.contains("payload")) {
            const auto& payload = j.at("payload");
            if (payload.is_null()) {
                config.body.reset();
            } else if (payload.is_string()) {
                config.body = payload.get<std::string>();
            } else {
                config.body = payload.dump();
            }
        }
    } catch (const json::exception& e) {
        Logger::error("Failed to parse JSON configuration: " + std::string(e.what()));
        return false;
    }

    return true;
}

std::string ConfigManager::configToJson(const LoadTestConfig& config) const {
    json j;
    j["url"] = config.url;
    j["method"] = config.method;
    j["qps"] = config.qps;
    j["duration"] = config.durationSeconds;
    j["concurrency"] = config.concurrency;
    j["timeout"] = config.timeoutSeconds;
    j["headers"] = json(config.headers);
    j["payload"] = config.body ? json(*config.body) : json(nullptr);
    j["expected_status"] = config.expectedStatusCode;
    j["verbose"] = config.verbose;
    j["output"] = config.outputPath;
    j["latency_csv"] = config.latencyCsvEnabled;
    j["progress"] = config.progressEnabled;
    j["log_level"] = config.logLevel;
    return j.dump(4);
}

} // namespace utils
} // namespace loadpulse
