#ifndef STMTGUARD_UTIL_LOGGER_HPP
#define STMTGUARD_UTIL_LOGGER_HPP

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
 * @brief A thread-safe logging utility for StmtGuard.
 *
 * Console output goes to stderr: the CLI reserves stdout for scrubbed text.
 * Callers must never pass statement content to the logger, only counts and
 * document fingerprints.
 *
 * Usage:
 *   - logger::setLogLevel(logger::parseLogLevel(cfg.logLevel));
 *   - logger::debug("RecordMasker: masked 2 field(s)");
 *   - logger::enableFileOutput("stmtguard.log", true);
 */

namespace stmtguard {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR
};

/**
 * @brief Tag printed in front of every line of the given level.
 */
inline const char* levelTag(LogLevel level)
{
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

/**
 * @brief Parse a level name ("debug", "INFO", "warning", ...) into a LogLevel.
 * @throw std::runtime_error on an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    throw std::runtime_error("logger: unknown log level '" + name + "'");
}

/**
 * @brief Process-wide sink shared by the redaction engine and the CLI:
 *  - Thread-safe, one line per call
 *  - Level threshold
 *  - Optional copy of every line to a file
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
     * @param level The desired log level.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threshold_ = level;
    }

    /**
     * @brief Copy every line to a file as well as stderr.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     * @return false if the file could not be opened (stderr logging continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto mode = append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc);
        auto file = std::make_unique<std::ofstream>(filename, mode);
        if (!file->is_open()) {
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return false;
        }
        fileStream_ = std::move(file);
        return true;
    }

    /**
     * @brief Write one message at the given level.
     */
    void write(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < threshold_) {
            return;
        }

        std::string line = "[" + timestamp() + "][" + levelTag(level) + "] " + msg + "\n";
        std::cerr << line;
        std::cerr.flush();

        if (fileStream_) {
            (*fileStream_) << line;
            fileStream_->flush();
        }
    }

private:
    // Private constructor for singleton
    Logger()
        : threshold_(LogLevel::INFO)
    {
    }

    // Non-copyable, non-assignable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Local wall-clock time, "YYYY-MM-DD HH:MM:SS".
     */
    static std::string timestamp()
    {
        auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif
        std::ostringstream out;
        out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        return out.str();
    }

    std::mutex mutex_;
    LogLevel threshold_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline bool enableFileOutput(const std::string &filename, bool append = false)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().write(LogLevel::DEBUG, msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().write(LogLevel::INFO, msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().write(LogLevel::WARN, msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().write(LogLevel::ERROR, msg);
}

} // namespace logger
} // namespace util
} // namespace stmtguard

#endif // STMTGUARD_UTIL_LOGGER_HPP
