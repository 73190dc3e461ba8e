#ifndef QUIETMQTT_LOGGER_HPP_
#define QUIETMQTT_LOGGER_HPP_

#include <cstdint>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <fmt/format.h>
#include "dllexport.h"

namespace quietmqtt
{

    enum class LogLevel : int32_t
    {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        OFF = 5
    };

    // Process-wide, thread-safe line logger. Writes to stderr until
    // initialize() points it at a file.
    class Logger
    {
    public:
        QUIETMQTT_DLLEXPORT static Logger &instance();

        // debug lowers the threshold to DEBUG; logFile, when given, replaces
        // stderr. Returns 0, or -1 if the file could not be opened (stderr
        // stays in use).
        QUIETMQTT_DLLEXPORT int initialize(const char *appName,
                                           bool debug = false,
                                           const char *logFile = nullptr);

        QUIETMQTT_DLLEXPORT void setLevel(LogLevel level);
        QUIETMQTT_DLLEXPORT LogLevel getLevel() const;

        // nullptr restores stderr.
        QUIETMQTT_DLLEXPORT void setOutput(std::ostream *os);

        QUIETMQTT_DLLEXPORT bool isEnabled(LogLevel level) const;
        QUIETMQTT_DLLEXPORT void write(LogLevel level, const std::string &message);

        template <typename... Args>
        void log(LogLevel level, const char *format, Args &&...args)
        {
            if (!isEnabled(level))
                return;
            write(level, fmt::vformat(format, fmt::make_format_args(args...)));
        }

    private:
        Logger();
        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;

        mutable std::mutex mutex_;
        LogLevel level_;
        std::string appName_;
        std::ofstream file_;
        std::ostream *out_;
    };

    template <typename... Args>
    void logTrace(const char *format, Args &&...args)
    {
        Logger::instance().log(LogLevel::TRACE, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void logDebug(const char *format, Args &&...args)
    {
        Logger::instance().log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void logInfo(const char *format, Args &&...args)
    {
        Logger::instance().log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void logWarn(const char *format, Args &&...args)
    {
        Logger::instance().log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void logError(const char *format, Args &&...args)
    {
        Logger::instance().log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

} // namespace quietmqtt
#endif // QUIETMQTT_LOGGER_HPP_
