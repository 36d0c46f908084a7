/**
 * @file logging.hpp
 * @brief Minimal leveled, category-tagged logger for library diagnostics.
 *
 * The library never logs key material. Output goes to the registered sinks;
 * by default a single stderr sink at level Warn is installed.
 */

#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace Sigil {

    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Off = 5
    };

    /// Convert log level to string
    const char* logLevelToString(LogLevel level);

    /// Parse log level from string ("trace", "DEBUG", ...); unknown names map to Info
    LogLevel logLevelFromString(const std::string& str);

    /// Categories used by the library
    namespace LogCategory {
        constexpr const char* REGISTRY = "registry";
        constexpr const char* KEYS = "keys";
        constexpr const char* HD = "hd";
        constexpr const char* ADDRESS = "address";
    }

    /// A single log entry
    struct LogEntry {
        LogLevel level;
        std::string category;
        std::string message;
        const char* file;
        int line;
    };

    /**
     * @class LogSink
     * @brief Destination for log entries.
     */
    class LogSink {
    public:
        virtual ~LogSink() = default;
        virtual void write(const LogEntry& entry) = 0;
    };

    /// @brief Writes "[level] category: message" lines to stderr.
    class StderrSink : public LogSink {
    public:
        void write(const LogEntry& entry) override;

    private:
        std::mutex mutex_;
    };

    /// @brief Forwards every entry to a user callback.
    class CallbackSink : public LogSink {
    public:
        using Callback = std::function<void(const LogEntry&)>;

        explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

        void write(const LogEntry& entry) override {
            if (callback_) callback_(entry);
        }

    private:
        Callback callback_;
    };

    /**
     * @class Logger
     * @brief Process-wide logger singleton.
     */
    class Logger {
    public:
        static Logger& instance();

        void addSink(std::shared_ptr<LogSink> sink);
        void removeSink(const std::shared_ptr<LogSink>& sink);
        void clearSinks();

        void setLevel(LogLevel level) { level_.store(level); }
        LogLevel level() const { return level_.load(); }

        bool willLog(LogLevel level) const {
            return level != LogLevel::Off && level >= level_.load();
        }

        void log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file = nullptr, int line = 0);

    private:
        Logger();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        std::vector<std::shared_ptr<LogSink>> sinks_;
        mutable std::mutex sinksMutex_;
        std::atomic<LogLevel> level_{LogLevel::Warn};
    };

    /**
     * @class LogStream
     * @brief Collects a message with operator<< and emits it on destruction.
     */
    class LogStream {
    public:
        LogStream(LogLevel level, const char* category, const char* file, int line)
            : level_(level), category_(category), file_(file), line_(line) {}

        ~LogStream() {
            try {
                Logger::instance().log(level_, category_, stream_.str(), file_, line_);
            } catch (const std::exception&) {
                // a failing sink must not escape a destructor
            }
        }

        LogStream(const LogStream&) = delete;
        LogStream& operator=(const LogStream&) = delete;

        template <typename T>
        LogStream& operator<<(const T& value) {
            stream_ << value;
            return *this;
        }

    private:
        std::ostringstream stream_;
        LogLevel level_;
        const char* category_;
        const char* file_;
        int line_;
    };

} // namespace Sigil

#define SIGIL_LOG(level, category) \
    if (!::Sigil::Logger::instance().willLog(::Sigil::LogLevel::level)) {} \
    else ::Sigil::LogStream(::Sigil::LogLevel::level, category, __FILE__, __LINE__)

#define SIGIL_LOG_TRACE(category) SIGIL_LOG(Trace, category)
#define SIGIL_LOG_DEBUG(category) SIGIL_LOG(Debug, category)
#define SIGIL_LOG_INFO(category)  SIGIL_LOG(Info, category)
#define SIGIL_LOG_WARN(category)  SIGIL_LOG(Warn, category)
#define SIGIL_LOG_ERROR(category) SIGIL_LOG(Error, category)

#endif // LOGGING_HPP
