#include <iostream>
#include <string>
#include <vector>
#include "core/run_controller.hpp"
#include "http/curl_http_client.hpp"
#include "report/report_writer.hpp"
#include "utils/command_line.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace loadpulse;

int main(int argc, char* argv[]) {
    utils::Logger::initialize();

    std::vector<std::string> args(argv + 1, argv + argc);
    const std::string program = argc > 0 ? argv[0] : "loadpulse";

    // First pass only locates --config and catches usage errors
    utils::LoadTestConfig scratch;
    auto probe = utils::parseCommandLine(args, scratch);
    if (!probe.ok()) {
        std::cerr << "Error: " << probe.error << "\n\n" << utils::usage(program);
        return 2;
    }
    if (probe.showHelp) {
        std::cout << utils::usage(program);
        return 0;
    }

    utils::ConfigManager configManager;
    if (!probe.configPath.empty() && !configManager.loadFromFile(probe.configPath, false)) {
        return 2;
    }

    // Flags override the file
    utils::LoadTestConfig config = configManager.getConfig();
    auto parsed = utils::parseCommandLine(args, config);
    if (!parsed.ok()) {
        std::cerr << "Error: " << parsed.error << "\n\n" << utils::usage(program);
        return 2;
    }
    utils::ConfigManager::applyRequestDefaults(config);

    utils::LogLevel level;
    if (utils::Logger::parseLevel(config.logLevel, level)) {
        utils::Logger::setLevel(level);
    }

    try {
        http::CurlGlobal curl;

        core::RunController controller(config, http::CurlHttpClient::factory());
        auto recorder = controller.run();

        report::ReportWriter writer(config.outputPath, config.verbose, config.latencyCsvEnabled);
        writer.write(*recorder, std::cout);

    } catch (const utils::InvalidConfigurationException& e) {
        utils::ErrorHandler::getInstance().reportError(e, "main");
        std::cerr << "\n" << utils::usage(program);
        return 2;
    } catch (const std::exception& e) {
        utils::ErrorHandler::getInstance().reportError(e, "main");
        return 1;
    }

    return 0;
}
