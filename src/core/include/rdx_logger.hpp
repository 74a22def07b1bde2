#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <thread>
#include <functional>

namespace rdx {

/**
 * @brief Logging levels for RDX
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    NONE  = 6
};

/**
 * @brief Thread-safe logger shared by the server, sessions and tools
 *
 * Console and file sinks, a global level, timestamped lines tagged with
 * the emitting thread so interleaved session output stays readable.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level_;
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return level >= level_ && level_ != LogLevel::NONE;
    }

    void setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx_);
        console_enabled_ = enabled;
    }

    bool setFileOutput(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        file_enabled_ = false;
        if (path.empty()) return false;
        file_.open(path, std::ios::app);
        file_enabled_ = file_.is_open();
        return file_enabled_;
    }

    void trace(const std::string& msg) { log(LogLevel::TRACE, msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg)  { log(LogLevel::INFO,  msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN,  msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }
    void fatal(const std::string& msg) { log(LogLevel::FATAL, msg); }

    void log(LogLevel level, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level < level_ || level_ == LogLevel::NONE) return;

        std::string formatted = formatMessage(level, msg);

        if (console_enabled_) {
            if (level >= LogLevel::WARN) {
                std::cerr << formatted << std::endl;
            } else {
                std::cout << formatted << std::endl;
            }
        }

        if (file_enabled_ && file_.is_open()) {
            file_ << formatted << std::endl;
            file_.flush();
        }
    }

    static LogLevel levelFromString(const std::string& s) {
        if (s == "trace") return LogLevel::TRACE;
        if (s == "debug") return LogLevel::DEBUG;
        if (s == "info")  return LogLevel::INFO;
        if (s == "warn" || s == "warning") return LogLevel::WARN;
        if (s == "error") return LogLevel::ERROR;
        if (s == "fatal") return LogLevel::FATAL;
        if (s == "none")  return LogLevel::NONE;
        return LogLevel::INFO;
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default:              return "?????";
        }
    }

private:
    Logger()
        : level_(LogLevel::INFO)
        , console_enabled_(true)
        , file_enabled_(false)
    {}

    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    std::string formatMessage(LogLevel level, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << levelToString(level) << "] "
            << "(" << std::hex << (std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xffff)
            << std::dec << ") " << msg;
        return oss.str();
    }

    LogLevel level_;
    bool console_enabled_;
    bool file_enabled_;
    std::ofstream file_;
    mutable std::mutex mtx_;
};

// Convenience macros; the message expression is only built when the level is enabled
#define RDX_LOG_AT(lvl, msg) \
    do { \
        if (rdx::Logger::instance().enabled(lvl)) { \
            std::ostringstream rdx_log_oss_; \
            rdx_log_oss_ << msg; \
            rdx::Logger::instance().log(lvl, rdx_log_oss_.str()); \
        } \
    } while (0)

#define RDX_LOG_TRACE(msg) RDX_LOG_AT(rdx::LogLevel::TRACE, msg)
#define RDX_LOG_DEBUG(msg) RDX_LOG_AT(rdx::LogLevel::DEBUG, msg)
#define RDX_LOG_INFO(msg)  RDX_LOG_AT(rdx::LogLevel::INFO,  msg)
#define RDX_LOG_WARN(msg)  RDX_LOG_AT(rdx::LogLevel::WARN,  msg)
#define RDX_LOG_ERROR(msg) RDX_LOG_AT(rdx::LogLevel::ERROR, msg)
#define RDX_LOG_FATAL(msg) RDX_LOG_AT(rdx::LogLevel::FATAL, msg)

} // namespace rdx
