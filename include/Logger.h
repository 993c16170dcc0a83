#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include "Common.h"

class Logger {
public:
    static Logger& instance();

    // Lines below minLevel are dropped. An empty filePath logs to the console only.
    void configure(LogLevel minLevel, const std::string& filePath = "");
    void setConsoleEnabled(bool enabled);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    void log(const std::string& prefix, LogLevel level, const std::string& message);
    // Hex + printable dump of a frame, written at DEBUG
    void logData(const std::string& prefix, const std::string& direction, const std::string& data);

    // 禁用复制构造和赋值
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    void writeLine(LogLevel level, const std::string& line);

    mutable std::mutex m_mutex;
    LogLevel m_minLevel = LogLevel::INFO;
    bool m_console = true;
    std::ofstream m_file;
};

#define LOG(prefix, level, message) \
    Logger::instance().log(prefix, level, message)

#define LOG_DEBUG(prefix, message) \
    do { if (Logger::instance().enabled(LogLevel::DEBUG)) LOG(prefix, LogLevel::DEBUG, message); } while (0)
#define LOG_INFO(prefix, message) LOG(prefix, LogLevel::INFO, message)
#define LOG_WARNING(prefix, message) LOG(prefix, LogLevel::WARNING, message)
#define LOG_ERROR(prefix, message) LOG(prefix, LogLevel::ERROR, message)
