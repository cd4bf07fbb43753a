#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <set>
#include <atomic>

namespace core {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Thread-safe Logger utility.
 * Sessions may run concurrently, so every line is written under one lock.
 * Lines below the process-wide minimum level are discarded before formatting.
 */
class Logger {
public:
    static void log(LogLevel level, const std::string& message) {
        if (level < minLevel_.load(std::memory_order_relaxed)) return;

        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::clog << "[" << std::put_time(std::localtime(&time), "%H:%M:%S")
                  << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: std::clog << "\033[36m[DEBUG]\033[0m "; break; // Cyan
            case LogLevel::INFO:  std::clog << "\033[32m[INFO] \033[0m "; break; // Green
            case LogLevel::WARN:  std::clog << "\033[33m[WARN] \033[0m "; break; // Yellow
            case LogLevel::ERROR: std::clog << "\033[31m[ERROR]\033[0m "; break; // Red
        }

        std::clog << message << std::endl;
    }

    static void setLevel(LogLevel level) { minLevel_.store(level, std::memory_order_relaxed); }
    static LogLevel level() { return minLevel_.load(std::memory_order_relaxed); }

    // Helper for formatted logging
    template<typename... Args>
    static void debug(Args... args) {
        if (LogLevel::DEBUG < level()) return;
        log(LogLevel::DEBUG, format(args...));
    }

    template<typename... Args>
    static void info(Args... args) {
        if (LogLevel::INFO < level()) return;
        log(LogLevel::INFO, format(args...));
    }

    template<typename... Args>
    static void warn(Args... args) {
        log(LogLevel::WARN, format(args...));
    }

    template<typename... Args>
    static void error(Args... args) {
        log(LogLevel::ERROR, format(args...));
    }

    template<typename... Args>
    static std::string format(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        return ss.str();
    }

private:
    inline static std::mutex mutex_;
    inline static std::atomic<LogLevel> minLevel_{LogLevel::INFO};
};

/**
 * Per-owner deduplication of warnings.
 * A session owns one instance, so "once per session per joint" means one
 * line per key for the lifetime of that instance.
 */
class LogOnce {
public:
    template<typename... Args>
    bool warn(const std::string& key, Args... args) {
        if (!seen_.insert(key).second) return false;
        Logger::warn(args...);
        return true;
    }

    [[nodiscard]] bool seen(const std::string& key) const { return seen_.count(key) > 0; }
    [[nodiscard]] size_t size() const { return seen_.size(); }
    void clear() { seen_.clear(); }

private:
    std::set<std::string> seen_;
};

} // namespace core
