#include "utils/command_line.hpp"
#include <sstream>
#include <stdexcept>

namespace loadpulse {
namespace utils {

namespace {

bool isFlag(const std::string& arg) {
    return arg.size() > 2 && arg.compare(0, 2, "--") == 0;
}

bool toDouble(const std::string& text, double& value) {
    try {
        size_t used = 0;
        value = std::stod(text, &used);
        return used == text.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

bool toInt(const std::string& text, int& value) {
    try {
        size_t used = 0;
        value = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

std::string trim(const std::string& text) {
    const char* ws = " \t";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

} // namespace

CommandLineResult parseCommandLine(const std::vector<std::string>& args, LoadTestConfig& config) {
    CommandLineResult result;
    bool headersReplaced = false;
    bool urlSeen = false;
    std::string authToken;
    bool authSeen = false;

    for (size_t i = 0; i < args.size() && result.ok(); ++i) {
        const std::string& arg = args[i];
        bool hasValue = i + 1 < args.size();

        auto needValue = [&](const std::string& name) -> bool {
            if (!hasValue) {
                result.error = "Missing value for " + name;
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            result.showHelp = true;
        } else if (arg == "--qps" || arg == "--duration" || arg == "--timeout") {
            if (!needValue(arg)) break;
            double value = 0.0;
            if (!toDouble(args[++i], value)) {
                result.error = "Invalid number for " + arg + ": " + args[i];
                break;
            }
            if (arg == "--qps") {
                config.qps = value;
            } else if (arg == "--duration") {
                config.durationSeconds = value;
            } else {
                config.timeoutSeconds = value;
            }
        } else if (arg == "--concurrency" || arg == "--expected_status") {
            if (!needValue(arg)) break;
            int value = 0;
            if (!toInt(args[++i], value)) {
                result.error = "Invalid integer for " + arg + ": " + args[i];
                break;
            }
            if (arg == "--concurrency") {
                config.concurrency = value;
            } else {
                config.expectedStatusCode = value;
            }
        } else if (arg == "--method") {
            if (!needValue(arg)) break;
            config.method = args[++i];
        } else if (arg == "--headers") {
            // Consumes every following key:value until the next flag
            if (!headersReplaced) {
                config.headers.clear();
                headersReplaced = true;
            }
            while (i + 1 < args.size() && !isFlag(args[i + 1])) {
                const std::string& header = args[++i];
                auto colon = header.find(':');
                if (colon == std::string::npos || colon == 0) {
                    result.error = "Header must be in key:value format: " + header;
                    break;
                }
                config.headers[trim(header.substr(0, colon))] = trim(header.substr(colon + 1));
            }
        } else if (arg == "--payload") {
            if (!needValue(arg)) break;
            config.body = args[++i];
        } else if (arg == "--auth") {
            if (!needValue(arg)) break;
            authToken = args[++i];
            authSeen = true;
        } else if (arg == "--output") {
            if (!needValue(arg)) break;
            config.outputPath = args[++i];
        } else if (arg == "--config") {
            if (!needValue(arg)) break;
            result.configPath = args[++i];
        } else if (arg == "--log-level") {
            if (!needValue(arg)) break;
            config.logLevel = args[++i];
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--quiet") {
            config.verbose = false;
        } else if (arg == "--latency-csv") {
            config.latencyCsvEnabled = true;
        } else if (arg == "--no-progress") {
            config.progressEnabled = false;
        } else if (isFlag(arg) || (arg.size() > 1 && arg[0] == '-')) {
            result.error = "Unknown option: " + arg;
        } else if (!urlSeen) {
            config.url = arg;
            urlSeen = true;
        } else {
            result.error = "Unexpected argument: " + arg;
        }
    }

    // Applied last so a later --headers cannot drop it
    if (result.ok() && authSeen) {
        config.headers["Authorization"] = "Bearer " + authToken;
    }

    return result;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " <url> --qps <n> [options]\n"
        << "HTTP load testing and benchmarking tool\n\n"
        << "Options:\n"
        << "  --qps <n>                 Requests per second (required)\n"
        << "  --duration <s>            Test duration in seconds (default: 60)\n"
        << "  --concurrency <n>         Number of concurrent workers (default: 1)\n"
        << "  --timeout <s>             Timeout for each request in seconds (default: 5)\n"
        << "  --method <m>              GET, POST, PUT or DELETE (default: GET)\n"
        << "  --headers <k:v> ...       Custom headers in key:value format\n"
        << "  --payload <body>          Request payload for POST/PUT requests\n"
        << "  --expected_status <code>  Expected status code for validation (default: 200)\n"
        << "  --auth <token>            Authentication token, sent as Bearer\n"
        << "  --output <path>           File to save the JSON report (default: test_report)\n"
        << "  --latency-csv             Also save per-request latencies as CSV\n"
        << "  --quiet                   Do not print the report to the console\n"
        << "  --verbose                 Print the report to the console (default)\n"
        << "  --no-progress             Disable periodic progress lines\n"
        << "  --config <file>           Load settings from a JSON file, flags override it\n"
        << "  --log-level <level>       DEBUG, INFO, WARN or ERROR (default: INFO)\n"
        << "  --help, -h                Show this help message\n";
    return out.str();
}

} // namespace utils
} // namespace loadpulse
