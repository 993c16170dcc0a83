// src/BridgeCoordinator.cpp
#include "BridgeCoordinator.hpp"
#include "Logger.h"

namespace {
const char* kPrefix = "bridge";
}

BridgeCoordinator::BridgeCoordinator(SerialLink& link, ClientRegistry& registry, SerialConfig config)
    : m_link(link), m_registry(registry), m_config(std::move(config)) {
    m_link.setControlHandler([this](const ControlMessage& message) {
        announceLinkError(message);
    });
}

BridgeCoordinator::~BridgeCoordinator() {
    stop();
    m_link.setControlHandler(nullptr);
}

boost::system::error_code BridgeCoordinator::start() {
    if (m_isRunning) return {};
    m_isRunning = true;
    m_errorAnnounced = false;

    auto ec = m_link.open(m_config);
    if (ec) {
        LOG_ERROR(kPrefix, "UART unavailable at startup (" + m_link.status().lastError
                  + "), serving clients without it until reconnect");
        return ec;
    }

    ec = m_link.startReader([this](const FramePtr& frame) { onSerialFrame(frame); });
    if (ec) {
        LOG_ERROR(kPrefix, "Failed to start serial reader: " + ec.message());
    }
    return ec;
}

void BridgeCoordinator::stop() {
    if (!m_isRunning) return;
    m_isRunning = false;
    m_link.close();
    LOG_INFO(kPrefix, "Bridge stopped");
}

void BridgeCoordinator::onSerialFrame(const FramePtr& frame) {
    m_registry.broadcast(frame);
}

ClientHandle BridgeCoordinator::attachClient() {
    return m_registry.registerClient(
        ControlMessage::info("Connected to UART WebSocket Bridge", m_link.status()));
}

void BridgeCoordinator::detachClient(const ClientHandle& client) {
    // AlreadyRemoved is expected when both the read and write side give up
    auto ec = m_registry.unregisterClient(client);
    if (ec && ec != RegistryError::AlreadyRemoved) {
        LOG_WARNING(kPrefix, "Client removal failed: " + ec.message());
    }
}

boost::system::error_code BridgeCoordinator::handleClientMessage(const ClientHandle& client,
                                                                 const std::string& payload,
                                                                 bool binary) {
    if (!binary) {
        LOG_DEBUG(kPrefix, "Ignoring text message from client #" + std::to_string(client->id()));
        m_registry.sendControlOnce(client, ControlMessage::warning(
            "Text messages are not forwarded to UART, send binary frames"));
        return {};
    }

    auto ec = m_link.write(payload);
    if (!ec) return ec;

    LOG_WARNING(kPrefix, "Write from client #" + std::to_string(client->id()) + " failed: "
                + ec.message());
    m_registry.sendControl(client, ControlMessage::error("Failed to send data to UART: " + ec.message(),
                                                         m_link.status()));
    announceIfLinkFailed(ec.message());
    return ec;
}

boost::system::error_code BridgeCoordinator::sendData(const Frame& data) {
    auto ec = m_link.write(data);
    if (ec) {
        announceIfLinkFailed(ec.message());
    }
    return ec;
}

boost::system::error_code BridgeCoordinator::reconnect() {
    std::lock_guard<std::mutex> lock(m_reconnectMutex);

    // every operator-triggered attempt gets its own failure notice
    m_errorAnnounced = false;
    auto ec = m_link.reconnect();
    if (ec) {
        announceIfLinkFailed("UART reconnect failed: " + m_link.status().lastError);
        return ec;
    }

    ec = m_link.startReader([this](const FramePtr& frame) { onSerialFrame(frame); });
    if (ec) {
        LOG_ERROR(kPrefix, "Failed to restart serial reader: " + ec.message());
        return ec;
    }
    m_registry.sendControlAll(ControlMessage::info("UART reconnected", m_link.status()));
    LOG_INFO(kPrefix, "UART reconnected, " + std::to_string(m_registry.count()) + " clients attached");
    return {};
}

void BridgeCoordinator::announceIfLinkFailed(const std::string& reason) {
    SerialLinkState state = m_link.status();
    if (state.status == LinkStatus::Error) {
        announceLinkError(ControlMessage::error(
            state.lastError.empty() ? reason : state.lastError, state));
    }
}

void BridgeCoordinator::announceLinkError(const ControlMessage& message) {
    if (m_errorAnnounced.exchange(true)) return;
    std::size_t notified = m_registry.sendControlAll(message);
    LOG_WARNING(kPrefix, "UART link error announced to " + std::to_string(notified) + " clients");
}
