#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace streamcore::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr; stdout belongs to the CLI output.
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

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::clog << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define STREAMCORE_LOG_DEBUG(msg) streamcore::core::logging::Logger::get().log(streamcore::core::logging::LogLevel::DEBUG, msg)
    #define STREAMCORE_LOG_INFO(msg)  streamcore::core::logging::Logger::get().log(streamcore::core::logging::LogLevel::INFO, msg)
    #define STREAMCORE_LOG_WARN(msg)  streamcore::core::logging::Logger::get().log(streamcore::core::logging::LogLevel::WARN, msg)
    #define STREAMCORE_LOG_ERROR(msg) streamcore::core::logging::Logger::get().log(streamcore::core::logging::LogLevel::ERROR, msg)

} // namespace streamcore::core::logging
