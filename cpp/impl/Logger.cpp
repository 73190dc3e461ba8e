#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <iostream>

namespace quietmqtt
{

    namespace
    {
        const char *levelName(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::TRACE:
                return "TRACE";
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARN:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::OFF:
                return "OFF";
            }
            return "?????";
        }

        std::string timestamp()
        {
            using namespace std::chrono;
            auto now = system_clock::now();
            std::time_t seconds = system_clock::to_time_t(now);
            auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
            std::tm local{};
            localtime_r(&seconds, &local);
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
            return fmt::format("{}.{:03d}", buffer, static_cast<int>(millis));
        }
    }

    Logger &Logger::instance()
    {
        static Logger logger;
        return logger;
    }

    Logger::Logger() : level_(LogLevel::INFO), appName_("quietmqtt"), out_(&std::cerr) {}

    int Logger::initialize(const char *appName, bool debug, const char *logFile)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (appName && *appName)
        {
            appName_ = appName;
        }
        level_ = debug ? LogLevel::DEBUG : LogLevel::INFO;

        if (!logFile || !*logFile)
        {
            return 0;
        }
        if (file_.is_open())
        {
            file_.close();
        }
        file_.open(logFile, std::ios::out | std::ios::app);
        if (!file_.is_open())
        {
            out_ = &std::cerr;
            *out_ << timestamp() << " [ERROR] " << appName_
                  << ": cannot open log file " << logFile << std::endl;
            return -1;
        }
        out_ = &file_;
        return 0;
    }

    void Logger::setLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel Logger::getLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void Logger::setOutput(std::ostream *os)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::cerr;
    }

    bool Logger::isEnabled(LogLevel level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level != LogLevel::OFF && level >= level_;
    }

    void Logger::write(LogLevel level, const std::string &message)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level == LogLevel::OFF || level < level_)
        {
            return;
        }
        *out_ << timestamp() << " [" << levelName(level) << "] " << appName_ << ": " << message << std::endl;
    }

} // namespace quietmqtt
