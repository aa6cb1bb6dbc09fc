#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "config/relay_config.hpp"
#include "generation/generation_service.hpp"
#include "generation/offline_generation_service.hpp"
#include "generation/openai_generation_service.hpp"
#include "io/request_loader.hpp"
#include "pipeline/report_printer.hpp"
#include "pipeline/request_processor.hpp"
#include "redaction/pattern_catalog.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

std::unique_ptr<piirelay::generation::GenerationService>
makeService(const piirelay::config::RelayConfig& cfg) {
    if (cfg.apiKey.empty()) {
        piirelay::util::logger::warn(
            "[main] OPENAI_API_KEY not set, using the offline generation service. "
            "Responses will not come from a model.");
        return std::make_unique<piirelay::generation::OfflineGenerationService>(
            cfg.offlineChunkSize, std::chrono::milliseconds(cfg.offlineFragmentDelayMs));
    }

    piirelay::generation::OpenAiGenerationService::Options options;
    options.apiKey = cfg.apiKey;
    options.model = cfg.model;
    options.baseUrl = cfg.apiBaseUrl;
    options.temperature = cfg.temperature;
    options.timeoutSeconds = static_cast<long>(cfg.requestTimeoutSeconds);
    return std::make_unique<piirelay::generation::OpenAiGenerationService>(options);
}

} // namespace

int main(int argc, char** argv) {
    piirelay::util::logger::Logger::getInstance().setLogLevel(
        piirelay::util::logger::LogLevel::INFO);

    // 1. Parse configuration: file (key=value or .env), then environment
    piirelay::config::RelayConfig relayConfig;
    std::string configPath = "piirelay.conf";
    if (argc > 1) {
        configPath = argv[1];
    }
    try {
        piirelay::util::ConfigParser configParser(relayConfig);
        configParser.loadFromFile(configPath);
        configParser.applyEnvironment();
        if (argc > 2) {
            relayConfig.requestsFile = argv[2];
        }

        piirelay::util::logger::setLogLevel(
            piirelay::util::logger::parseLogLevel(relayConfig.logLevel));
        if (!relayConfig.logFile.empty()) {
            piirelay::util::logger::enableFileOutput(relayConfig.logFile, true);
        }
    } catch (const std::exception& ex) {
        piirelay::util::logger::critical(std::string("[main] Invalid configuration: ") + ex.what());
        return 1;
    }

    // 2. Load every request before anything is redacted or sent
    std::vector<piirelay::io::PromptRequest> requests;
    try {
        requests = piirelay::io::RequestLoader::loadFromFile(relayConfig.requestsFile);
    } catch (const std::exception& ex) {
        piirelay::util::logger::critical(std::string("[main] Error reading requests: ") +
                                         ex.what());
        return 1;
    }

    // 3. Generation backend
    std::unique_ptr<piirelay::generation::GenerationService> service = makeService(relayConfig);
    piirelay::util::logger::info("[main] Using generation service " + service->name());

    // 4. Process requests one after another
    piirelay::pipeline::RequestProcessor processor(piirelay::redaction::PatternCatalog::standard(),
                                                   *service, std::cout, relayConfig.streaming);
    piirelay::pipeline::ReportPrinter printer(std::cout);

    size_t failed = 0;
    for (size_t i = 0; i < requests.size(); ++i) {
        printer.printRequestHeader(i + 1);
        piirelay::pipeline::RequestOutcome outcome = processor.process(requests[i]);
        printer.printOutcome(outcome);
        if (!outcome.succeeded) {
            ++failed;
        }
    }
    printer.printSummary(requests.size(), failed);

    piirelay::util::logger::info("[main] PiiRelay exiting.");
    return failed == 0 ? 0 : 2;
}
