// include/ControlMessage.hpp
#pragma once
#include <optional>
#include <string>
#include "SerialLinkState.hpp"

// Out-of-band JSON message sent to WebSocket clients next to raw data frames
struct ControlMessage {
    enum class Kind {
        Info,
        Warning,
        Error
    };

    Kind kind = Kind::Info;
    std::string message;
    std::optional<SerialLinkState> linkStatus;
    std::string timestamp;

    static ControlMessage info(const std::string& message, const SerialLinkState& state);
    static ControlMessage warning(const std::string& message);
    static ControlMessage error(const std::string& message,
                                std::optional<SerialLinkState> state = std::nullopt);

    // {"type":"info","message":...,"uartStatus":{...},"timestamp":...}
    std::string toJson() const;
};

std::string controlKindToString(ControlMessage::Kind kind);
