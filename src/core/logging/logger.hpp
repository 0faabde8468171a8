#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace warden::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so every executor shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }
            // stderr: stdout belongs to the sandboxed command's output in the CLI
            std::clog << "[" << level_to_string(level) << "] " << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) warden::core::logging::Logger::get().log(warden::core::logging::LogLevel::ERROR, msg)

} // namespace warden::core::logging
