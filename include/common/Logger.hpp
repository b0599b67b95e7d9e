#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace common {

/**
 * @brief Interface for logging
 * Shared by the session, every recorder and every pipeline worker.
 */
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;
};

/**
 * @brief Console logger implementation
 * Timestamped lines; warnings and errors go to stderr, debug only when verbose.
 * Safe to call from several worker threads.
 */
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(bool verbose = false) : verbose_(verbose) {}

    void info(const std::string& message) override {
        log(std::cout, "INFO", message);
    }

    void warn(const std::string& message) override {
        log(std::cerr, "WARNING", message);
    }

    void error(const std::string& message) override {
        log(std::cerr, "ERROR", message);
    }

    void debug(const std::string& message) override {
        if (verbose_) log(std::cout, "DEBUG", message);
    }

private:
    void log(std::ostream& out, const char* level, const std::string& message) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);

        std::lock_guard<std::mutex> lock(mutex_);
        out << "[" << std::put_time(&tm_buf, "%H:%M:%S")
            << "] [" << level << "] " << message << std::endl;
    }

    bool verbose_;
    std::mutex mutex_;
};

/**
 * @brief Null logger for testing or disabled logging
 */
class NullLogger : public ILogger {
public:
    void info(const std::string&) override {}
    void warn(const std::string&) override {}
    void error(const std::string&) override {}
    void debug(const std::string&) override {}
};

} // namespace common
