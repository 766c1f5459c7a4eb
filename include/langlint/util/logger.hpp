#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace langlint {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

protected:
    LogLevel min_level_ = LogLevel::INFO;
};

/**
 * Writes "[LEVEL] message" lines to stderr.
 * Safe to share between batch worker threads.
 */
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::INFO) {
        min_level_ = min_level;
    }

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;

        const char* prefix = "";
        switch (level) {
            case LogLevel::DEBUG:   prefix = "[DEBUG] "; break;
            case LogLevel::INFO:    prefix = "[INFO] "; break;
            case LogLevel::WARNING: prefix = "[WARN] "; break;
            case LogLevel::ERROR:   prefix = "[ERROR] "; break;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << prefix << message << std::endl;
    }

private:
    std::mutex mutex_;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

using LoggerPtr = std::shared_ptr<Logger>;

inline LoggerPtr make_null_logger() {
    return std::make_shared<NullLogger>();
}

}  // namespace langlint
