#ifndef PIIRELAY_UTIL_CONFIG_PARSER_HPP
#define PIIRELAY_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <istream>
#include <stdexcept>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <initializer_list>
#include <mutex>
#include "config/relay_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Minimal parser that fills piirelay::config::RelayConfig.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" file. The same reader accepts dotenv content:
 *     '#' comments, an optional "export " prefix and quoted values.
 *   - Environment variables (OPENAI_API_KEY, OPENAI_MODEL, OPENAI_BASE_URL)
 *     override the file, mirroring how a .env file is normally layered.
 *   - Header-only, no external libraries.
 *
 * USAGE:
 *   @code
 *   piirelay::config::RelayConfig cfg;
 *   piirelay::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("piirelay.conf");
 *   parser.applyEnvironment();
 *   @endcode
 */

namespace piirelay {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(piirelay::config::RelayConfig &relayConfig)
        : relayConfig_(relayConfig)
    {
    }

    /**
     * @brief Parse a config file. A missing file is not an error: defaults stay.
     * @return true if the file was found and read.
     * @throw std::runtime_error on malformed lines or values.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            piirelay::util::logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return false;
        }

        piirelay::util::logger::info("ConfigParser: Loading config from " + filepath);
        parseStream(inFile, filepath);
        piirelay::util::logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Parse key=value lines from any stream. origin is used in error messages.
     * @throw std::runtime_error on malformed lines or values.
     */
    inline void loadFromStream(std::istream &in, const std::string &origin = "<stream>")
    {
        std::lock_guard<std::mutex> lock(mutex_);
        parseStream(in, origin);
    }

    /**
     * @brief Override settings from the process environment.
     */
    inline void applyEnvironment()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const char *name : {"OPENAI_API_KEY", "OPENAI_MODEL", "OPENAI_BASE_URL"}) {
            const char *value = std::getenv(name);
            if (value != nullptr && *value != '\0') {
                applyKeyValue(name, value);
            }
        }
    }

private:
    piirelay::config::RelayConfig &relayConfig_;
    std::mutex mutex_;

    inline void parseStream(std::istream &in, const std::string &origin)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }
            if (line.compare(0, 7, "export ") == 0) {
                line.erase(0, 7);
                trim(line);
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: " + origin + ":" + std::to_string(lineNo)
                                         + ": invalid line (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            unquote(val);

            applyKeyValue(key, val);
        }
    }

    /**
     * @brief Apply one recognised key to relayConfig_. Unknown keys are logged and ignored.
     */
    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "OPENAI_API_KEY" || key == "apiKey") {
            relayConfig_.apiKey = val;
            // Never log the key itself.
            piirelay::util::logger::debug("ConfigParser: apiKey set (" + std::to_string(val.size()) + " chars)");
        }
        else if (key == "OPENAI_MODEL" || key == "model") {
            relayConfig_.model = val;
            piirelay::util::logger::debug("ConfigParser: model set to " + val);
        }
        else if (key == "OPENAI_BASE_URL" || key == "apiBaseUrl") {
            relayConfig_.apiBaseUrl = val;
            piirelay::util::logger::debug("ConfigParser: apiBaseUrl set to " + val);
        }
        else if (key == "temperature") {
            relayConfig_.temperature = parseDouble(val);
            piirelay::util::logger::debug("ConfigParser: temperature set to " + val);
        }
        else if (key == "streaming") {
            relayConfig_.streaming = parseBool(val);
            piirelay::util::logger::debug(std::string("ConfigParser: streaming set to ")
                                          + (relayConfig_.streaming ? "true" : "false"));
        }
        else if (key == "requestTimeoutSeconds") {
            relayConfig_.requestTimeoutSeconds = parseUInt32(val);
            piirelay::util::logger::debug("ConfigParser: requestTimeoutSeconds set to " + val);
        }
        else if (key == "requestsFile") {
            relayConfig_.requestsFile = val;
            piirelay::util::logger::debug("ConfigParser: requestsFile set to " + val);
        }
        else if (key == "offlineChunkSize") {
            relayConfig_.offlineChunkSize = parseUInt32(val);
            if (relayConfig_.offlineChunkSize == 0) {
                throw std::runtime_error("ConfigParser: offlineChunkSize must be positive");
            }
            piirelay::util::logger::debug("ConfigParser: offlineChunkSize set to " + val);
        }
        else if (key == "offlineFragmentDelayMs") {
            relayConfig_.offlineFragmentDelayMs = parseUInt32(val);
            piirelay::util::logger::debug("ConfigParser: offlineFragmentDelayMs set to " + val);
        }
        else if (key == "logLevel") {
            // Validate now so a typo fails at startup.
            piirelay::util::logger::parseLogLevel(val);
            relayConfig_.logLevel = val;
        }
        else if (key == "logFile") {
            relayConfig_.logFile = val;
        }
        else {
            piirelay::util::logger::warn("ConfigParser: Unrecognized key '" + key + "'");
        }
    }

    inline static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    inline static void unquote(std::string &s)
    {
        if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
            s = s.substr(1, s.size() - 2);
        }
    }

    inline static uint32_t parseUInt32(const std::string &val)
    {
        try {
            size_t idx = 0;
            unsigned long long n = std::stoull(val, &idx, 10);
            if (idx != val.size() || val[0] == '-') {
                throw std::runtime_error("Non-numeric suffix");
            }
            if (n > std::numeric_limits<uint32_t>::max()) {
                throw std::runtime_error("out of range");
            }
            return static_cast<uint32_t>(n);
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt32 failed on '" + val + "': " + ex.what());
        }
    }

    inline static double parseDouble(const std::string &val)
    {
        try {
            size_t idx = 0;
            double d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return d;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseDouble failed on '" + val + "': " + ex.what());
        }
    }

    inline static bool parseBool(const std::string &val)
    {
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        }
        if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        throw std::runtime_error("ConfigParser: expected a boolean, got '" + val + "'");
    }
};

} // namespace util
} // namespace piirelay

#endif // PIIRELAY_UTIL_CONFIG_PARSER_HPP
