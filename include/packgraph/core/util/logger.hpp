/**
 * @file logger.hpp
 * @brief Logging utilities for packgraph.
 *
 * Provides a singleton Logger class and logging macros for different log levels.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <iostream>

namespace packgraph {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

    /**
     * @class Logger
     * @brief Singleton logger class for packgraph.
     *
     * Provides thread-safe logging with customizable log sinks and log levels.
     * The default sink writes to stderr so decoded output on stdout stays clean.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        /**
         * @brief Get the singleton Logger instance.
         * @return Reference to the Logger instance
         */
        static Logger& inst() {
            static Logger L;  return L;
        }

        /**
         * @brief Set the minimum log level.
         * @param lvl LogLevel to set
         */
        void setLevel(LogLevel lvl) {
            std::scoped_lock lk(m_);
            level_ = lvl;
        }

        LogLevel level() const {
            std::scoped_lock lk(m_);
            return level_;
        }

        /**
         * @brief Set a custom log sink function.
         * @param s Sink function to use
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = std::move(s);
        }

        /**
         * @brief Restore the default stderr sink.
         */
        void resetSink() { setSink(defaultSink()); }

        /**
         * @brief Whether a message at the given level would be emitted.
         */
        bool enabled(LogLevel lvl) const {
            std::scoped_lock lk(m_);
            return lvl >= level_ && level_ != LogLevel::Off;
        }

        /**
         * @brief Log a message at the specified log level.
         * @param lvl LogLevel for the message
         * @param msg Message to log
         */
        void log(LogLevel lvl, const std::string& msg) {
            std::scoped_lock lk(m_);
            if (lvl < level_ || level_ == LogLevel::Off) return;
            if (sink_) sink_(lvl, msg);
        }

    private:
        Logger() : sink_(defaultSink()) {}

        static Sink defaultSink() {
            return [](LogLevel l, const std::string& m) {
                static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR","OFF" };
                std::cerr << "[" << names[static_cast<int>(l)] << "] " << m << '\n';
            };
        }

        mutable std::mutex m_;
        LogLevel   level_{ LogLevel::Info };
        Sink       sink_;
    };

#define LOG_TRACE(msg) do { if (::packgraph::Logger::inst().enabled(::packgraph::LogLevel::Trace)) ::packgraph::Logger::inst().log(::packgraph::LogLevel::Trace, msg); } while (0)
#define LOG_DEBUG(msg) do { if (::packgraph::Logger::inst().enabled(::packgraph::LogLevel::Debug)) ::packgraph::Logger::inst().log(::packgraph::LogLevel::Debug, msg); } while (0)
#define LOG_INFO(msg)  ::packgraph::Logger::inst().log(::packgraph::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::packgraph::Logger::inst().log(::packgraph::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::packgraph::Logger::inst().log(::packgraph::LogLevel::Error, msg)
}
