// include/SerialLinkState.hpp
#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "BridgeConfig.hpp"

enum class LinkStatus {
    Disconnected,
    Connecting,
    Connected,
    Error
};

std::string linkStatusToString(LinkStatus status);

// Snapshot of the serial link; the live copy belongs to SerialLink
struct SerialLinkState {
    SerialConfig config;
    LinkStatus status = LinkStatus::Disconnected;
    std::string lastError;

    bool connected() const { return status == LinkStatus::Connected; }
};

// {connected, port, baudrate, bytesize, stopbits, parity}
nlohmann::json uartStatusJson(const SerialLinkState& state);
