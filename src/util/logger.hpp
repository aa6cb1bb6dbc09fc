#ifndef PIIRELAY_UTIL_LOGGER_HPP
#define PIIRELAY_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <cctype>
#include <stdexcept>

/**
 * @file logger.hpp
 * @brief Process-wide diagnostic log for PiiRelay.
 *
 * Lines have the form "[YYYY-MM-DD HH:MM:SS][LEVEL] message". They go to
 * std::cerr, because std::cout carries the live stream and the per-request
 * report, and optionally to a log file as well.
 *
 * Only redacted text, counts and error messages are logged. Original
 * (unredacted) values must never be passed to the logger.
 *
 * Usage:
 *   - logger::setLogLevel(logger::parseLogLevel(config.logLevel));
 *   - logger::enableFileOutput("piirelay.log", true);
 *   - logger::info("RequestProcessor: 2 placeholder(s) minted");
 */

namespace piirelay {
namespace util {
namespace logger {

/**
 * @brief Severity of a log line, lowest first.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Name written between brackets in each line.
 */
inline const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARN:     return "WARN";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a level name as written in the logLevel config key.
 *
 * Case-insensitive; "WARNING" is accepted for WARN.
 *
 * @throw std::runtime_error on an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (upper == "WARNING") {
        return LogLevel::WARN;
    }
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN,
                           LogLevel::ERROR, LogLevel::CRITICAL}) {
        if (upper == levelName(level)) {
            return level;
        }
    }
    throw std::runtime_error("logger: unknown log level '" + name + "'");
}

/**
 * @brief Thread-safe singleton behind the free functions below.
 *
 * One mutex serializes the threshold, the file sink and the writes, so lines
 * from different threads never interleave.
 */
class Logger {
public:
    /**
     * @brief The process-wide instance, created on first use.
     */
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Lines below this level are dropped. INFO until changed.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threshold_ = level;
    }

    /**
     * @brief Copy every following line into a file as well.
     *
     * A file sink opened earlier is closed first.
     *
     * @param filename Path of the log file.
     * @param append Keep existing content instead of truncating.
     * @return false if the file cannot be opened; console output is unaffected.
     */
    bool enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.reset();
        auto file = std::make_unique<std::ofstream>(
            filename, append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!file->is_open()) {
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return false;
        }
        file_ = std::move(file);
        return true;
    }

    /**
     * @brief Write one line at the given level, if it passes the threshold.
     */
    void write(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < threshold_) {
            return;
        }
        const std::string line = formatLine(level, msg);
        std::cerr << line << std::flush;
        if (file_) {
            (*file_) << line << std::flush;
        }
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string formatLine(LogLevel level, const std::string &msg)
    {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "]["
             << levelName(level) << "] " << msg << "\n";
        return line.str();
    }

    std::mutex mutex_;
    LogLevel threshold_ = LogLevel::INFO;
    std::unique_ptr<std::ofstream> file_;
};

// ----------------------------------------------------------------------------
//  Free functions used throughout the code base
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = false)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void debug(const std::string &msg)    { Logger::getInstance().write(LogLevel::DEBUG, msg); }
inline void info(const std::string &msg)     { Logger::getInstance().write(LogLevel::INFO, msg); }
inline void warn(const std::string &msg)     { Logger::getInstance().write(LogLevel::WARN, msg); }
inline void error(const std::string &msg)    { Logger::getInstance().write(LogLevel::ERROR, msg); }
inline void critical(const std::string &msg) { Logger::getInstance().write(LogLevel::CRITICAL, msg); }

} // namespace logger
} // namespace util
} // namespace piirelay

#endif // PIIRELAY_UTIL_LOGGER_HPP
