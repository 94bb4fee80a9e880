#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace knife::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(const std::string& text) {
        if (text == "debug" || text == "DEBUG") return LogLevel::DEBUG;
        if (text == "info" || text == "INFO") return LogLevel::INFO;
        if (text == "warn" || text == "WARN") return LogLevel::WARN;
        if (text == "error" || text == "ERROR") return LogLevel::ERROR;
        return std::nullopt;
    }

    // Process-wide logger. The bridge points it at stderr because stdout
    // carries protocol frames.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_component(const std::string& component) {
            std::lock_guard<std::mutex> lock(mutex_);
            component_ = component;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void set_stream(std::ostream& stream) {
            std::lock_guard<std::mutex> lock(mutex_);
            stream_ = &stream;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *stream_ << "[" << level_to_string(level) << "] "
                     << (component_.empty() ? "" : "[" + component_ + "] ")
                     << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string component_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* stream_ = &std::cerr;

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

    #define KNIFE_LOG_DEBUG(msg) knife::core::logging::Logger::get().log(knife::core::logging::LogLevel::DEBUG, msg)
    #define KNIFE_LOG_INFO(msg)  knife::core::logging::Logger::get().log(knife::core::logging::LogLevel::INFO, msg)
    #define KNIFE_LOG_WARN(msg)  knife::core::logging::Logger::get().log(knife::core::logging::LogLevel::WARN, msg)
    #define KNIFE_LOG_ERROR(msg) knife::core::logging::Logger::get().log(knife::core::logging::LogLevel::ERROR, msg)

} // namespace knife::core::logging
