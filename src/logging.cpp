#include "../include/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

/**
 * @file logging.cpp
 * @brief Implementation of the library logger.
 */

namespace Sigil {

    namespace {

        std::string basename(const char* path) {
            std::string p(path ? path : "");
            size_t pos = p.find_last_of("/\\");
            return (pos == std::string::npos) ? p : p.substr(pos + 1);
        }
    }

    const char* logLevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Trace: return "TRACE";
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info:  return "INFO";
            case LogLevel::Warn:  return "WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Off:   return "OFF";
        }
        return "UNKNOWN";
    }

    LogLevel logLevelFromString(const std::string& str) {
        std::string upper = str;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        if (upper == "TRACE") return LogLevel::Trace;
        if (upper == "DEBUG") return LogLevel::Debug;
        if (upper == "INFO")  return LogLevel::Info;
        if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
        if (upper == "ERROR") return LogLevel::Error;
        if (upper == "OFF")   return LogLevel::Off;

        return LogLevel::Info;
    }

    void StderrSink::write(const LogEntry& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entry.file) {
            std::fprintf(stderr, "[%s] %s: %s (%s:%d)\n", logLevelToString(entry.level),
                         entry.category.c_str(), entry.message.c_str(),
                         basename(entry.file).c_str(), entry.line);
        } else {
            std::fprintf(stderr, "[%s] %s: %s\n", logLevelToString(entry.level),
                         entry.category.c_str(), entry.message.c_str());
        }
    }

    Logger::Logger() {
        sinks_.push_back(std::make_shared<StderrSink>());
    }

    Logger& Logger::instance() {
        static Logger logger;
        return logger;
    }

    void Logger::addSink(std::shared_ptr<LogSink> sink) {
        if (!sink) return;
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks_.push_back(std::move(sink));
    }

    void Logger::removeSink(const std::shared_ptr<LogSink>& sink) {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
    }

    void Logger::clearSinks() {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks_.clear();
    }

    void Logger::log(LogLevel level, const std::string& category, const std::string& message,
                     const char* file, int line) {
        if (!willLog(level)) return;

        LogEntry entry{level, category, message, file, line};

        // Copy the sink list so a sink may log or unregister itself.
        std::vector<std::shared_ptr<LogSink>> sinks;
        {
            std::lock_guard<std::mutex> lock(sinksMutex_);
            sinks = sinks_;
        }
        for (const auto& sink : sinks) {
            sink->write(entry);
        }
    }

} // namespace Sigil
