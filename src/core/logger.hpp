#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <optional>

namespace querylens::core {

/**
 * @brief Log levels for resolver diagnostics
 */
enum class LogLevel {
    TRACE,   // Every ODBC round trip
    DEBUG,   // Mode decisions, cache hits and misses
    INFO,    // Per-query progress
    WARN,    // Recoverable oddities (catalog lookups failing, etc.)
    ERROR,   // Query failures
    FATAL    // Nothing more can be done
};

/**
 * @brief Parse a level name ("trace" ... "fatal", case-insensitive)
 */
std::optional<LogLevel> parse_log_level(std::string_view name);

/**
 * @brief Thread-safe process-wide logger
 * 
 * querylens writes reports and generated code to stdout, so console lines
 * always go to stderr. A log file, when set, receives the same lines.
 * 
 * Usage:
 *   Logger::instance().set_level(LogLevel::DEBUG);
 *   Logger::instance().set_output("querylens.log");
 *   
 *   LOG_DEBUG("Resolving query get_user online");
 *   LOG_IF(cache_hit, "Using cached metadata", "Cache miss");
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    /**
     * @brief Set output file (empty closes the file)
     */
    void set_output(std::string_view filename);

    void set_console_enabled(bool enabled);

    void log(LogLevel level, std::string_view file, int line,
             std::string_view function, std::string_view message);

    /**
     * @brief Log a branch decision at DEBUG
     */
    void log_branch(bool condition, std::string_view file, int line,
                   std::string_view function,
                   std::string_view true_msg,
                   std::string_view false_msg = "");

    // "[time] [LEVEL] [file.cpp:line] [function] message", file without its directory
    static std::string format_line(LogLevel level, std::string_view file, int line,
                                   std::string_view function, std::string_view message);

private:
    Logger() = default;
    ~Logger() = default;

    LogLevel min_level_ = LogLevel::WARN;
    bool console_enabled_ = true;
    std::ofstream file_stream_;
    mutable std::mutex mutex_;
};

} // namespace querylens::core

#define LOG_TRACE(msg) \
    querylens::core::Logger::instance().log( \
        querylens::core::LogLevel::TRACE, __FILE__, __LINE__, __func__, msg)

#define LOG_DEBUG(msg) \
    querylens::core::Logger::instance().log( \
        querylens::core::LogLevel::DEBUG, __FILE__, __LINE__, __func__, msg)

#define LOG_INFO(msg) \
    querylens::core::Logger::instance().log( \
        querylens::core::LogLevel::INFO, __FILE__, __LINE__, __func__, msg)

#define LOG_WARN(msg) \
    querylens::core::Logger::instance().log( \
        querylens::core::LogLevel::WARN, __FILE__, __LINE__, __func__, msg)

#define LOG_ERROR(msg) \
    querylens::core::Logger::instance().log( \
        querylens::core::LogLevel::ERROR, __FILE__, __LINE__, __func__, msg)

#define LOG_FATAL(msg) \
    querylens::core::Logger::instance().log( \
        querylens::core::LogLevel::FATAL, __FILE__, __LINE__, __func__, msg)

// Log branch decisions (IF statements)
#define LOG_IF(condition, true_msg, ...) \
    querylens::core::Logger::instance().log_branch( \
        (condition), __FILE__, __LINE__, __func__, \
        true_msg, ##__VA_ARGS__)
