#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace drift::core::logging {

    // 1. Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Tag prepended to every line, e.g. the snapshot or run being processed.
        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Command output goes to stdout; diagnostics stay on stderr.
        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] "
                  << (context_.empty() ? "" : "[" + context_ + "] ")
                  << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cerr;

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

    // 3. Helper macros
    #define DRIFT_LOG_DEBUG(msg) drift::core::logging::Logger::get().log(drift::core::logging::LogLevel::DEBUG, msg)
    #define DRIFT_LOG_INFO(msg)  drift::core::logging::Logger::get().log(drift::core::logging::LogLevel::INFO, msg)
    #define DRIFT_LOG_WARN(msg)  drift::core::logging::Logger::get().log(drift::core::logging::LogLevel::WARN, msg)
    #define DRIFT_LOG_ERROR(msg) drift::core::logging::Logger::get().log(drift::core::logging::LogLevel::ERROR, msg)

} // namespace drift::core::logging
