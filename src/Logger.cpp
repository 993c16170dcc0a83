#include "Logger.h"
#include <chrono>
#include <ctime>
#include <iostream>
#include <stdexcept>

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.close();
    }
}

void Logger::configure(LogLevel minLevel, const std::string& filePath) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minLevel = minLevel;
    if (m_file.is_open()) {
        m_file.close();
    }
    if (!filePath.empty()) {
        m_file.open(filePath, std::ios::out | std::ios::app);
        if (!m_file.is_open()) {
            throw std::runtime_error("Cannot open log file: " + filePath);
        }
    }
}

void Logger::setConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console = enabled;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_minLevel;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(level) >= static_cast<int>(m_minLevel);
}

void Logger::log(const std::string& prefix, LogLevel level, const std::string& message) {
    if (!enabled(level)) return;

    // 获取当前时间
    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_local{};
    localtime_r(&now_time, &tm_local);
    char time_str[20];
    std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &tm_local);

    std::string line = "[" + std::string(time_str) + "] [" + logLevelToString(level) + "] ["
                       + prefix + "] " + message;
    writeLine(level, line);
}

void Logger::logData(const std::string& prefix, const std::string& direction, const std::string& data) {
    if (!enabled(LogLevel::DEBUG)) return;
    log(prefix, LogLevel::DEBUG, direction + " " + std::to_string(data.size())
        + " bytes Hex: " + hexStr(data));
}

void Logger::writeLine(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_console) {
        if (level >= LogLevel::WARNING) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
    }
    if (m_file.is_open()) {
        m_file << line << std::endl;
    }
}
