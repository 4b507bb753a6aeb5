#pragma once
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include "core/logging/redactor.hpp"

namespace sous::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Receives fully formatted lines; replaces stdout when set.
    using LogSink = std::function<void(LogLevel, const std::string&)>;

    class Logger {
    public:
        // Singleton access so every session shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Tags lines logged from the calling thread; each session runs its
        // turns on its own thread.
        void set_session_id(const std::string& id) {
            thread_session_id() = id;
        }

        std::string session_id() const {
            return thread_session_id();
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void set_sink(LogSink sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = std::move(sink);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            const std::string& session_id = thread_session_id();
            const std::string line =
                "[" + level_to_string(level) + "] " +
                (session_id.empty() ? "" : "[" + session_id + "] ") +
                redact_secrets(message);
            if (sink_) {
                sink_(level, line);
                return;
            }
            std::cout << line << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;
        LogSink sink_;

        static std::string& thread_session_id() {
            thread_local std::string id;
            return id;
        }

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

    #define SOUS_LOG_DEBUG(msg) sous::core::logging::Logger::get().log(sous::core::logging::LogLevel::DEBUG, msg)
    #define SOUS_LOG_INFO(msg)  sous::core::logging::Logger::get().log(sous::core::logging::LogLevel::INFO, msg)
    #define SOUS_LOG_WARN(msg)  sous::core::logging::Logger::get().log(sous::core::logging::LogLevel::WARN, msg)
    #define SOUS_LOG_ERROR(msg) sous::core::logging::Logger::get().log(sous::core::logging::LogLevel::ERROR, msg)

} // namespace sous::core::logging
