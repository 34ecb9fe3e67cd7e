#ifndef PIIGUARD_UTIL_LOGGER_HPP
#define PIIGUARD_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <algorithm>
#include <cctype>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for piiguard.
 *
 * Console output is written to stderr: the CLI reserves stdout for span lists and
 * redacted text, so log lines must never interleave with data.
 *
 * Usage:
 *   - logger::setLogLevel(logger::parseLogLevel("debug"));
 *   - logger::debug("PrimaryScanner: rule=email accepted=3");
 *   - logger::enableFileOutput("piiguard.log", true);
 *
 * Callers log counts, rule names and offsets only. Input text never reaches the log.
 */

namespace piiguard {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name (case-insensitive) such as "debug" or "WARN".
 * @throw std::runtime_error on an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug")    return LogLevel::DEBUG;
    if (lower == "info")     return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error")    return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    throw std::runtime_error("Logger: unknown log level '" + name + "'");
}

inline const char* levelName(LogLevel level)
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

namespace detail {

/// "YYYY-mm-dd HH:MM:SS" in local time.
inline std::string timestampNow()
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm parts{};
#ifdef _WIN32
    localtime_s(&parts, &now);
#else
    localtime_r(&now, &parts);
#endif
    std::ostringstream out;
    out << std::put_time(&parts, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace detail

/**
 * @brief Process-wide logger: a level threshold, a stderr sink that can be muted and
 *        an optional file sink. All members lock one mutex.
 */
class Logger {
public:
    /**
     * @brief Get the global Logger instance.
     */
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Set the minimal log level. Messages below this level are discarded.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Enable output to a file in addition to stderr.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     */
    void enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
        }
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    /**
     * @brief Silence or restore the stderr sink (the file sink is unaffected).
     */
    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleOutput_ = enabled;
    }

    /**
     * @brief True if a message at @p level would be written. Lets callers skip
     *        building expensive debug strings.
     */
    bool isEnabled(LogLevel level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= logLevel_;
    }

    void log(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        const std::string line = "[" + detail::timestampNow() + "][" + levelName(level) + "] " + msg + "\n";
        if (consoleOutput_) {
            std::cerr << line << std::flush;
        }
        if (fileStream_) {
            *fileStream_ << line << std::flush;
        }
    }

private:
    Logger()
        : logLevel_(LogLevel::WARN),
          consoleOutput_(true)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool consoleOutput_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// Shortcuts to the global instance
inline void setLogLevel(LogLevel level) { Logger::getInstance().setLogLevel(level); }
inline bool isEnabled(LogLevel level) { return Logger::getInstance().isEnabled(level); }
inline void setConsoleOutput(bool enabled) { Logger::getInstance().setConsoleOutput(enabled); }

inline void enableFileOutput(const std::string &filename, bool append = false)
{
    Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput() { Logger::getInstance().disableFileOutput(); }

inline void debug(const std::string &msg)    { Logger::getInstance().log(LogLevel::DEBUG, msg); }
inline void info(const std::string &msg)     { Logger::getInstance().log(LogLevel::INFO, msg); }
inline void warn(const std::string &msg)     { Logger::getInstance().log(LogLevel::WARN, msg); }
inline void error(const std::string &msg)    { Logger::getInstance().log(LogLevel::ERROR, msg); }
inline void critical(const std::string &msg) { Logger::getInstance().log(LogLevel::CRITICAL, msg); }

} // namespace logger
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_LOGGER_HPP
