// include/BridgeConfig.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "Common.h"

enum class Parity : char {
    None = 'N',
    Even = 'E',
    Odd = 'O',
    Mark = 'M',
    Space = 'S'
};

std::string parityToString(Parity parity);

struct SerialConfig {
    std::string device = "/dev/ttyUSB0";
    unsigned int baudRate = 115200;
    unsigned int byteSize = 8;      // 5..8
    unsigned int stopBits = 1;      // 1..2
    Parity parity = Parity::None;
    std::chrono::milliseconds readTimeout{1000};
    std::chrono::milliseconds writeTimeout{1000};
};

struct WebSocketConfig {
    std::chrono::seconds pingInterval{30};
    std::chrono::seconds pingTimeout{10};
    std::size_t maxMessageSize = 104857600;  // 100 MB
    std::size_t outboundQueueLimit = 256;    // frames per client
};

struct HttpConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    unsigned int ioThreads = 2;
};

struct LoggingConfig {
    LogLevel level = LogLevel::INFO;
    std::string file;
};

struct AppConfig {
    SerialConfig serial;
    WebSocketConfig websocket;
    HttpConfig http;
    LoggingConfig logging;
};

struct FieldIssue {
    std::string field;
    std::string reason;
};

struct ValidationError {
    std::vector<FieldIssue> issues;
    std::string message() const;
};

// Loosely typed settings keyed by lower-case option name (uart_port, http_port, ...)
using RawSettings = std::map<std::string, std::string>;
using ConfigResult = std::variant<AppConfig, ValidationError>;

extern const std::vector<unsigned int> kStandardBaudRates;

// Pure: no I/O, no logging. Non-standard baud rates inside the accepted range are
// reported through `warnings` rather than rejected.
ConfigResult validateConfig(const RawSettings& raw, std::vector<std::string>* warnings = nullptr);

// {"uart": {"port": ..., "baudrate": ...}, "http": {...}} or flat {"uart_port": ...}
RawSettings loadSettingsFile(const std::string& filename);
RawSettings settingsFromJson(const nlohmann::json& j);
// Picks up every recognised key from the process environment (UART_PORT, HTTP_PORT, ...)
void mergeEnvironment(RawSettings& settings);
void mergeSettings(RawSettings& into, const RawSettings& from);

const std::vector<std::string>& knownSettingKeys();

nlohmann::json serialConfigToJson(const SerialConfig& config);
nlohmann::json configToJson(const AppConfig& config);
