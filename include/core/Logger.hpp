#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Thread-safe Logger utility.
 * Messages below the configured level are dropped before formatting.
 * Note: Avoid per-frame INFO logging on the worker thread, stdout can block.
 */
class Logger {
public:
    static void setLevel(LogLevel level) {
        minLevel_.store(level, std::memory_order_relaxed);
    }

    [[nodiscard]] static LogLevel level() {
        return minLevel_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] static bool enabled(LogLevel level) {
        return static_cast<int>(level) >= static_cast<int>(Logger::level());
    }

    /**
     * Parses "debug", "info", "warn" or "error". Unknown names fall back to INFO.
     */
    static LogLevel parseLevel(const std::string& name) {
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "warn" || name == "warning") return LogLevel::WARN;
        if (name == "error") return LogLevel::ERROR;
        return LogLevel::INFO;
    }

    static void log(LogLevel level, const std::string& message) {
        if (!enabled(level)) return;

        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm localTime{};
        localtime_r(&time, &localTime);

        std::ostream& out = (level == LogLevel::ERROR) ? std::cerr : std::cout;

        out << "[" << std::put_time(&localTime, "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: out << "\033[36m[DEBUG]\033[0m "; break; // Cyan
            case LogLevel::INFO:  out << "\033[32m[INFO] \033[0m "; break; // Green
            case LogLevel::WARN:  out << "\033[33m[WARN] \033[0m "; break; // Yellow
            case LogLevel::ERROR: out << "\033[31m[ERROR]\033[0m "; break; // Red
        }

        out << message << std::endl;
    }

    // Helpers for formatted logging
    template<typename... Args>
    static void debug(Args&&... args) {
        if (!enabled(LogLevel::DEBUG)) return;
        log(LogLevel::DEBUG, format(std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void info(Args&&... args) {
        if (!enabled(LogLevel::INFO)) return;
        log(LogLevel::INFO, format(std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void warn(Args&&... args) {
        if (!enabled(LogLevel::WARN)) return;
        log(LogLevel::WARN, format(std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void error(Args&&... args) {
        log(LogLevel::ERROR, format(std::forward<Args>(args)...));
    }

private:
    template<typename... Args>
    static std::string format(Args&&... args) {
        std::stringstream ss;
        (ss << ... << std::forward<Args>(args));
        return ss.str();
    }

    inline static std::mutex mutex_;
    inline static std::atomic<LogLevel> minLevel_{LogLevel::INFO};
};

} // namespace core
