// include/Common.h
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

// One opaque chunk of bytes read from the serial line or received from a client.
// Shared immutably between every client queue it is fanned out to.
using Frame = std::string;
using FramePtr = std::shared_ptr<const Frame>;

inline FramePtr makeFrame(const char* data, std::size_t len) {
    return std::make_shared<const Frame>(data, len);
}

inline FramePtr makeFrame(std::string data) {
    return std::make_shared<const Frame>(std::move(data));
}

std::string logLevelToString(LogLevel level);
std::optional<LogLevel> logLevelFromString(const std::string& str);

// "48 65 6c" style dump used in debug logs
std::string hexStr(const std::string& data);

// "48656c6c6f" -> "Hello"; whitespace between byte pairs is tolerated.
// Returns std::nullopt on odd length or a non-hex digit.
std::optional<std::string> fromHex(const std::string& hex);

// Current UTC time as ISO-8601 with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string utcTimestamp();
