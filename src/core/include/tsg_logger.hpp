#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <functional>

namespace tsg {

/**
 * @brief Logging levels for tsguard
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
 * @brief Thread-safe logger shared by the guard pipeline and the chaos harness
 *
 * Console and file output, configurable level, timestamped lines.
 * Messages may carry a channel tag ("capture", "detector", ...) so that
 * data-quality events can be filtered downstream. An optional observer
 * receives every emitted line; it is invoked outside the logger lock.
 */
class Logger {
public:
    using Observer = std::function<void(LogLevel, const std::string& channel,
                                        const std::string& msg)>;

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

    void setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx_);
        console_enabled_ = enabled;
    }

    bool setFileOutput(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        if (path.empty()) {
            file_enabled_ = false;
            return true;
        }
        file_.open(path, std::ios::app);
        file_enabled_ = file_.is_open();
        return file_enabled_;
    }

    /// Install (or clear, with nullptr) the line observer.
    void setObserver(Observer observer) {
        std::lock_guard<std::mutex> lock(mtx_);
        observer_ = std::move(observer);
    }

    void trace(const std::string& msg) { log(LogLevel::TRACE, msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg)  { log(LogLevel::INFO,  msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN,  msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }
    void fatal(const std::string& msg) { log(LogLevel::FATAL, msg); }

    void log(LogLevel level, const std::string& msg) {
        log(level, std::string(), msg);
    }

    void log(LogLevel level, const std::string& channel, const std::string& msg) {
        Observer observer;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (level < level_) return;

            std::string formatted = formatMessage(level, channel, msg);

            if (console_enabled_) {
                if (level >= LogLevel::ERROR) {
                    std::cerr << formatted << std::endl;
                } else {
                    std::cout << formatted << std::endl;
                }
            }

            if (file_enabled_ && file_.is_open()) {
                file_ << formatted << std::endl;
                file_.flush();
            }
            observer = observer_;
        }
        if (observer) observer(level, channel, msg);
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

private:
    Logger()
        : level_(LogLevel::INFO)
        , console_enabled_(true)
        , file_enabled_(false)
    {}

    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    std::string formatMessage(LogLevel level, const std::string& channel,
                              const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << levelToString(level) << "] ";
        if (!channel.empty()) oss << '<' << channel << "> ";
        oss << msg;
        return oss.str();
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

    LogLevel level_;
    bool console_enabled_;
    bool file_enabled_;
    std::ofstream file_;
    Observer observer_;
    mutable std::mutex mtx_;
};

// Convenience macros
#define TSG_LOG_TRACE(msg) tsg::Logger::instance().trace(msg)
#define TSG_LOG_DEBUG(msg) tsg::Logger::instance().debug(msg)
#define TSG_LOG_INFO(msg)  tsg::Logger::instance().info(msg)
#define TSG_LOG_WARN(msg)  tsg::Logger::instance().warn(msg)
#define TSG_LOG_ERROR(msg) tsg::Logger::instance().error(msg)
#define TSG_LOG_FATAL(msg) tsg::Logger::instance().fatal(msg)

// Channel-tagged event (data-quality, degradation, chaos phase)
#define TSG_LOG_EVENT(level, channel, msg) \
    tsg::Logger::instance().log(tsg::LogLevel::level, channel, msg)

} // namespace tsg
