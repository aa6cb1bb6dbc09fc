#ifndef PIIRELAY_CONFIG_RELAY_CONFIG_HPP
#define PIIRELAY_CONFIG_RELAY_CONFIG_HPP

#include <string>
#include <cstdint>

/**
 * @file relay_config.hpp
 * @brief Process configuration for the PiiRelay command-line tool.
 *
 * USAGE:
 *   - Populated manually or through util/config_parser.hpp (file, then environment).
 *   - An empty apiKey selects the offline generation service.
 */

namespace piirelay {
namespace config {

/**
 * @struct RelayConfig
 * @brief Credentials, model selection and I/O settings for one run.
 */
struct RelayConfig
{
    /**
     * @brief Construct a RelayConfig with defaults:
     *   model = "gpt-4o-mini", apiBaseUrl = "https://api.openai.com/v1",
     *   temperature = 0.2, streaming = true, requestTimeoutSeconds = 120,
     *   requestsFile = "requests.csv", offlineChunkSize = 12,
     *   offlineFragmentDelayMs = 8, logLevel = "INFO"
     */
    RelayConfig()
        : model("gpt-4o-mini"),
          apiBaseUrl("https://api.openai.com/v1"),
          temperature(0.2),
          streaming(true),
          requestTimeoutSeconds(120),
          requestsFile("requests.csv"),
          offlineChunkSize(12),
          offlineFragmentDelayMs(8),
          logLevel("INFO")
    {
    }

    /// API credentials. Empty means "no network": the offline service is used.
    std::string apiKey;

    std::string model;

    /// Base URL; "/chat/completions" is appended.
    std::string apiBaseUrl;

    double temperature;

    /// Stream fragments (true) or ask for one complete response (false).
    bool streaming;

    uint32_t requestTimeoutSeconds;

    /// CSV with system_prompt and prompt columns.
    std::string requestsFile;

    uint32_t offlineChunkSize;
    uint32_t offlineFragmentDelayMs;

    std::string logLevel;

    /// Optional log file; empty keeps logging on the console only.
    std::string logFile;
};

} // namespace config
} // namespace piirelay

#endif // PIIRELAY_CONFIG_RELAY_CONFIG_HPP
