#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace xcdelta::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // Process-wide logger shared by the manager, the reaper and operation threads.
    // Writes to stderr; stdout carries the CLI's delta lines.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Tag printed in front of every message, e.g. the CLI's session id.
        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define XCDELTA_LOG_DEBUG(msg) xcdelta::core::logging::Logger::get().log(xcdelta::core::logging::LogLevel::DEBUG, msg)
    #define XCDELTA_LOG_INFO(msg)  xcdelta::core::logging::Logger::get().log(xcdelta::core::logging::LogLevel::INFO, msg)
    #define XCDELTA_LOG_WARN(msg)  xcdelta::core::logging::Logger::get().log(xcdelta::core::logging::LogLevel::WARN, msg)
    #define XCDELTA_LOG_ERROR(msg) xcdelta::core::logging::Logger::get().log(xcdelta::core::logging::LogLevel::ERROR, msg)

} // namespace xcdelta::core::logging
