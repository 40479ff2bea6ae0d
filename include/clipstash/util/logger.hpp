#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace clipstash {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

const char* log_level_name(LogLevel level);

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    void set_min_level(LogLevel level) { min_level_.store(level); }
    LogLevel get_min_level() const { return min_level_.load(); }

protected:
    // Read by every logging thread
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
};

class ConsoleLogger : public Logger {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_.load()) return;

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

/**
 * Appends one timestamped line per message:
 *   2026-01-31 14:05:09.123 [INFO] message
 */
class FileLogger : public Logger {
public:
    explicit FileLogger(const std::filesystem::path& path);

    void log(LogLevel level, const std::string& message) override;

    bool is_open() const { return out_.is_open(); }

private:
    std::mutex mutex_;
    std::ofstream out_;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

}  // namespace clipstash
