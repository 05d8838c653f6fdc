#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace querylens::core {

namespace {

struct LevelName {
    LogLevel level;
    const char* name;
};

constexpr LevelName LEVEL_NAMES[] = {
    {LogLevel::TRACE, "TRACE"},
    {LogLevel::DEBUG, "DEBUG"},
    {LogLevel::INFO,  "INFO"},
    {LogLevel::WARN,  "WARN"},
    {LogLevel::ERROR, "ERROR"},
    {LogLevel::FATAL, "FATAL"},
};

const char* level_name(LogLevel level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) return entry.name;
    }
    return "?????";
}

std::string_view base_name(std::string_view path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

// Local time with milliseconds
std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

} // anonymous namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string wanted(name);
    std::transform(wanted.begin(), wanted.end(), wanted.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (wanted == "WARNING") {
        return LogLevel::WARN;
    }
    for (const auto& entry : LEVEL_NAMES) {
        if (wanted == entry.name) return entry.level;
    }
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_output(std::string_view filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    if (!filename.empty()) {
        file_stream_.open(std::string(filename), std::ios::app);
    }
}

void Logger::set_console_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

std::string Logger::format_line(LogLevel level, std::string_view file, int line,
                                std::string_view function, std::string_view message) {
    std::ostringstream out;
    out << '[' << timestamp() << "] "
        << '[' << std::setw(5) << level_name(level) << "] "
        << '[' << base_name(file) << ':' << line << "] "
        << '[' << function << "] "
        << message;
    return out.str();
}

void Logger::log(LogLevel level, std::string_view file, int line,
                 std::string_view function, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }

    const std::string formatted = format_line(level, file, line, function, message);
    if (console_enabled_) {
        std::cerr << formatted << '\n';
    }
    if (file_stream_.is_open()) {
        file_stream_ << formatted << '\n';
        file_stream_.flush();
    }
}

void Logger::log_branch(bool condition, std::string_view file, int line,
                        std::string_view function,
                        std::string_view true_msg,
                        std::string_view false_msg) {
    if (LogLevel::DEBUG < level()) {
        return;
    }

    std::string message = condition ? "BRANCH: TRUE - " : "BRANCH: FALSE - ";
    if (condition) {
        message += true_msg;
    } else {
        message += false_msg.empty() ? std::string_view("condition false") : false_msg;
    }
    log(LogLevel::DEBUG, file, line, function, message);
}

} // namespace querylens::core
