#pragma once

#include "utils/config.hpp"
#include <string>
#include <vector>

namespace loadpulse {
namespace utils {

struct CommandLineResult {
    bool showHelp = false;
    std::string configPath;
    std::string error;

    bool ok() const { return error.empty(); }
};

/**
 * Apply command-line arguments (without the program name) on top of
 * config. --config is only recorded in the result, loading it is up to
 * the caller so that flags can override the file.
 */
CommandLineResult parseCommandLine(const std::vector<std::string>& args, LoadTestConfig& config);

std::string usage(const std::string& program);

} // namespace utils
} // namespace loadpulse
