#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace agentlink::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global logger. stdout carries the JSON-RPC stream, so every line goes to stderr.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

        static std::optional<LogLevel> parse_level(const std::string& text) {
            if (text == "debug" || text == "DEBUG") return LogLevel::DEBUG;
            if (text == "info" || text == "INFO") return LogLevel::INFO;
            if (text == "warn" || text == "WARN" || text == "warning") return LogLevel::WARN;
            if (text == "error" || text == "ERROR") return LogLevel::ERROR;
            return std::nullopt;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::WARN;

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

    // 3. Helper macros used everywhere else
    #define LOG_DEBUG(msg) agentlink::core::logging::Logger::get().log(agentlink::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  agentlink::core::logging::Logger::get().log(agentlink::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  agentlink::core::logging::Logger::get().log(agentlink::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) agentlink::core::logging::Logger::get().log(agentlink::core::logging::LogLevel::ERROR, msg)

} // namespace agentlink::core::logging
