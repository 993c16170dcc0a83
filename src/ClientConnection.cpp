// src/ClientConnection.cpp
#include "ClientConnection.hpp"
#include <algorithm>

const char* const ClientConnection::kOverflowWarning =
    "Client is not keeping up with UART data, frames are being dropped";

ClientConnection::ClientConnection(Id id, std::size_t frameCapacity)
    : m_id(id),
      m_connectedAt(std::chrono::system_clock::now()),
      m_frameCapacity(std::max<std::size_t>(frameCapacity, 1)) {}

bool ClientConnection::pushFrame(const FramePtr& frame) {
    bool queued = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) return false;

        if (m_queuedFrames < m_frameCapacity) {
            m_queue.push_back({OutboundMessage::Type::Binary, frame});
            ++m_queuedFrames;
            queued = true;
        } else {
            ++m_dropped;
            if (m_overflowed) {
                return false;
            }
            // one slot above the control reserve belongs to this warning
            if (m_queue.size() > m_frameCapacity + kControlReserve) {
                return false;
            }
            auto warning = ControlMessage::warning(kOverflowWarning);
            m_queue.push_back({OutboundMessage::Type::Text, makeFrame(warning.toJson())});
            m_overflowed = true;
        }
    }
    wake();
    return queued;
}

bool ClientConnection::pushControl(const ControlMessage& message) {
    FramePtr json = makeFrame(message.toJson());
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || m_queue.size() >= m_frameCapacity + kControlReserve) {
            return false;
        }
        m_queue.push_back({OutboundMessage::Type::Text, std::move(json)});
    }
    wake();
    return true;
}

bool ClientConnection::pushControlOnce(const ControlMessage& message) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_reminderQueued) {
            return false;
        }
        m_reminderQueued = true;
    }
    if (pushControl(message)) {
        return true;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_reminderQueued = false;
    return false;
}

bool ClientConnection::pop(OutboundMessage& out) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queue.empty()) return false;

    out = std::move(m_queue.front());
    m_queue.pop_front();
    if (out.type == OutboundMessage::Type::Binary) {
        --m_queuedFrames;
    }
    if (m_queue.empty()) {
        m_overflowed = false;
        m_reminderQueued = false;
    }
    return true;
}

void ClientConnection::setWakeHandler(WakeHandler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_wake = std::move(handler);
}

void ClientConnection::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
    m_queue.clear();
    m_queuedFrames = 0;
    m_wake = nullptr;
}

bool ClientConnection::closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

std::size_t ClientConnection::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

std::size_t ClientConnection::droppedFrames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

void ClientConnection::wake() {
    WakeHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handler = m_wake;
    }
    if (handler) {
        handler();
    }
}
