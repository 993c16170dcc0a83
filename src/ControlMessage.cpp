// src/ControlMessage.cpp
#include "ControlMessage.hpp"
#include "Common.h"

std::string linkStatusToString(LinkStatus status) {
    switch (status) {
        case LinkStatus::Disconnected: return "disconnected";
        case LinkStatus::Connecting: return "connecting";
        case LinkStatus::Connected: return "connected";
        case LinkStatus::Error: return "error";
    }
    return "unknown";
}

nlohmann::json uartStatusJson(const SerialLinkState& state) {
    return {
        {"connected", state.connected()},
        {"port", state.config.device},
        {"baudrate", state.config.baudRate},
        {"bytesize", state.config.byteSize},
        {"stopbits", state.config.stopBits},
        {"parity", parityToString(state.config.parity)}
    };
}

std::string controlKindToString(ControlMessage::Kind kind) {
    switch (kind) {
        case ControlMessage::Kind::Info: return "info";
        case ControlMessage::Kind::Warning: return "warning";
        case ControlMessage::Kind::Error: return "error";
    }
    return "info";
}

ControlMessage ControlMessage::info(const std::string& message, const SerialLinkState& state) {
    return ControlMessage{Kind::Info, message, state, utcTimestamp()};
}

ControlMessage ControlMessage::warning(const std::string& message) {
    return ControlMessage{Kind::Warning, message, std::nullopt, utcTimestamp()};
}

ControlMessage ControlMessage::error(const std::string& message, std::optional<SerialLinkState> state) {
    return ControlMessage{Kind::Error, message, std::move(state), utcTimestamp()};
}

std::string ControlMessage::toJson() const {
    nlohmann::json j;
    j["type"] = controlKindToString(kind);
    j["message"] = message;
    if (linkStatus) {
        j["uartStatus"] = uartStatusJson(*linkStatus);
    }
    j["timestamp"] = timestamp.empty() ? utcTimestamp() : timestamp;
    return j.dump();
}
