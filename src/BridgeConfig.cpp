// src/BridgeConfig.cpp
#include "BridgeConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

const std::vector<unsigned int> kStandardBaudRates = {
    300, 600, 1200, 2400, 4800, 9600, 14400, 19200,
    28800, 38400, 57600, 115200, 230400, 460800, 921600
};

namespace {

const unsigned int kMinBaudRate = 300;
const unsigned int kMaxBaudRate = 921600;
const std::size_t kMinMessageSize = 1024;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool parseUnsigned(const std::string& text, unsigned long long& out) {
    std::string s = trim(text);
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    out = std::strtoull(s.c_str(), &end, 10);
    return errno == 0 && end && *end == '\0';
}

bool parseSeconds(const std::string& text, double& out) {
    std::string s = trim(text);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return errno == 0 && end && *end == '\0' && std::isfinite(out);
}

std::optional<Parity> parseParity(const std::string& text) {
    std::string s = toLower(trim(text));
    if (s == "n" || s == "none") return Parity::None;
    if (s == "e" || s == "even") return Parity::Even;
    if (s == "o" || s == "odd") return Parity::Odd;
    if (s == "m" || s == "mark") return Parity::Mark;
    if (s == "s" || s == "space") return Parity::Space;
    return std::nullopt;
}

// Validation helper that records every failure instead of stopping at the first one
class Checker {
public:
    explicit Checker(const RawSettings& raw) : m_raw(raw) {}

    const std::string* find(const std::string& key) const {
        auto it = m_raw.find(key);
        return it == m_raw.end() ? nullptr : &it->second;
    }

    template <typename T>
    void unsignedIn(const std::string& key, T& target, unsigned long long min, unsigned long long max) {
        const std::string* value = find(key);
        if (!value) return;
        unsigned long long parsed = 0;
        if (!parseUnsigned(*value, parsed)) {
            fail(key, "expected a non-negative integer, got '" + *value + "'");
        } else if (parsed < min || parsed > max) {
            fail(key, "must be between " + std::to_string(min) + " and " + std::to_string(max)
                 + ", got " + std::to_string(parsed));
        } else {
            target = static_cast<T>(parsed);
        }
    }

    template <typename Duration>
    void seconds(const std::string& key, Duration& target, double min) {
        const std::string* value = find(key);
        if (!value) return;
        double parsed = 0;
        if (!parseSeconds(*value, parsed)) {
            fail(key, "expected a number of seconds, got '" + *value + "'");
        } else if (parsed < min) {
            fail(key, "must be >= " + std::to_string(min) + " seconds");
        } else {
            target = std::chrono::duration_cast<Duration>(std::chrono::duration<double>(parsed));
        }
    }

    void fail(const std::string& field, const std::string& reason) {
        m_error.issues.push_back({field, reason});
    }

    bool failed() const { return !m_error.issues.empty(); }
    ValidationError& error() { return m_error; }

private:
    const RawSettings& m_raw;
    ValidationError m_error;
};

} // namespace

std::string parityToString(Parity parity) {
    return std::string(1, static_cast<char>(parity));
}

std::string ValidationError::message() const {
    std::string out = "Invalid configuration:";
    for (const auto& issue : issues) {
        out += "\n  " + issue.field + ": " + issue.reason;
    }
    return out;
}

const std::vector<std::string>& knownSettingKeys() {
    static const std::vector<std::string> keys = {
        "http_host", "http_port", "http_io_threads",
        "uart_port", "uart_baudrate", "uart_bytesize", "uart_stopbits", "uart_parity",
        "uart_timeout", "uart_write_timeout",
        "ws_ping_interval", "ws_ping_timeout", "ws_max_size", "ws_queue_limit",
        "log_level", "log_file"
    };
    return keys;
}

ConfigResult validateConfig(const RawSettings& raw, std::vector<std::string>* warnings) {
    AppConfig config;
    Checker check(raw);

    if (const std::string* host = check.find("http_host")) {
        if (trim(*host).empty()) check.fail("http_host", "must not be empty");
        else config.http.host = trim(*host);
    }
    check.unsignedIn("http_port", config.http.port, 1, 65535);
    check.unsignedIn("http_io_threads", config.http.ioThreads, 1, 64);

    if (const std::string* port = check.find("uart_port")) {
        if (trim(*port).empty()) check.fail("uart_port", "UART port must not be empty");
        else config.serial.device = trim(*port);
    }
    check.unsignedIn("uart_baudrate", config.serial.baudRate, kMinBaudRate, kMaxBaudRate);
    if (warnings && std::find(kStandardBaudRates.begin(), kStandardBaudRates.end(),
                              config.serial.baudRate) == kStandardBaudRates.end()) {
        warnings->push_back("Non-standard baud rate: " + std::to_string(config.serial.baudRate));
    }
    check.unsignedIn("uart_bytesize", config.serial.byteSize, 5, 8);
    check.unsignedIn("uart_stopbits", config.serial.stopBits, 1, 2);
    if (const std::string* parity = check.find("uart_parity")) {
        auto parsed = parseParity(*parity);
        if (!parsed) check.fail("uart_parity", "must be one of N, E, O, M, S, got '" + *parity + "'");
        else config.serial.parity = *parsed;
    }
    check.seconds("uart_timeout", config.serial.readTimeout, 0.0);
    check.seconds("uart_write_timeout", config.serial.writeTimeout, 0.0);

    check.seconds("ws_ping_interval", config.websocket.pingInterval, 1.0);
    check.seconds("ws_ping_timeout", config.websocket.pingTimeout, 1.0);
    check.unsignedIn("ws_max_size", config.websocket.maxMessageSize, kMinMessageSize,
                     std::numeric_limits<uint32_t>::max());
    check.unsignedIn("ws_queue_limit", config.websocket.outboundQueueLimit, 1, 1u << 20);

    if (const std::string* level = check.find("log_level")) {
        auto parsed = logLevelFromString(trim(*level));
        if (!parsed) check.fail("log_level", "must be one of DEBUG, INFO, WARNING, ERROR, CRITICAL");
        else config.logging.level = *parsed;
    }
    if (const std::string* file = check.find("log_file")) {
        config.logging.file = trim(*file);
    }

    if (check.failed()) {
        return std::move(check.error());
    }
    return config;
}

RawSettings settingsFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Settings must be a JSON object");
    }

    auto scalar = [](const nlohmann::json& v) -> std::string {
        if (v.is_string()) return v.get<std::string>();
        return v.dump();
    };

    static const std::map<std::string, std::string> groups = {
        {"http", "http"}, {"uart", "uart"}, {"websocket", "ws"}, {"ws", "ws"},
        {"logging", "log"}, {"log", "log"}
    };

    RawSettings settings;
    for (auto it = j.begin(); it != j.end(); ++it) {
        std::string key = toLower(it.key());
        if (it.value().is_object()) {
            auto group = groups.find(key);
            if (group == groups.end()) continue;
            for (auto inner = it.value().begin(); inner != it.value().end(); ++inner) {
                settings[group->second + "_" + toLower(inner.key())] = scalar(inner.value());
            }
        } else if (!it.value().is_null()) {
            settings[key] = scalar(it.value());
        }
    }
    return settings;
}

RawSettings loadSettingsFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }

    nlohmann::json config_json;
    try {
        file >> config_json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + filename + ": " + e.what());
    }
    return settingsFromJson(config_json);
}

void mergeEnvironment(RawSettings& settings) {
    for (const auto& key : knownSettingKeys()) {
        const char* value = std::getenv(toUpper(key).c_str());
        if (!value) value = std::getenv(key.c_str());
        if (value) {
            settings[key] = value;
        }
    }
}

void mergeSettings(RawSettings& into, const RawSettings& from) {
    for (const auto& entry : from) {
        into[entry.first] = entry.second;
    }
}

nlohmann::json serialConfigToJson(const SerialConfig& config) {
    return {
        {"port", config.device},
        {"baudrate", config.baudRate},
        {"bytesize", config.byteSize},
        {"stopbits", config.stopBits},
        {"parity", parityToString(config.parity)},
        {"timeout", std::chrono::duration<double>(config.readTimeout).count()},
        {"write_timeout", std::chrono::duration<double>(config.writeTimeout).count()}
    };
}

nlohmann::json configToJson(const AppConfig& config) {
    return {
        {"http", {{"host", config.http.host}, {"port", config.http.port},
                  {"io_threads", config.http.ioThreads}}},
        {"uart", serialConfigToJson(config.serial)},
        {"websocket", {{"ping_interval", config.websocket.pingInterval.count()},
                       {"max_size", config.websocket.maxMessageSize},
                       {"ping_timeout", config.websocket.pingTimeout.count()},
                       {"queue_limit", config.websocket.outboundQueueLimit}}},
        {"logging", {{"level", logLevelToString(config.logging.level)}}}
    };
}
